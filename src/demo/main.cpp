#include "common/config_loader.hpp"
#include "common/logger.hpp"
#include "core/transaction/transaction_manager.hpp"
#include "core/transaction/transaction_scope.hpp"
#include "storage/memory/memory_resource.hpp"
#include "storage/mysql/mysql_resource.hpp"

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>

namespace {

using txbind::core::IsolationLevelToString;

void PrintResource(const char* label, txbind::core::TransactionalResource& resource) {
    auto level = resource.GetIsolationLevel();
    auto auto_commit = resource.GetAutoCommit();
    std::printf("%-8s %s isolation=%s autocommit=%s\n", label, resource.Describe().c_str(),
                level.IsOk() ? IsolationLevelToString(level.Value()).c_str() : level.GetStatus().Message().c_str(),
                auto_commit.IsOk() ? (auto_commit.Value() ? "on" : "off") : auto_commit.GetStatus().Message().c_str());
}

std::shared_ptr<txbind::core::ResourceFactory> MakeFactory(const txbind::common::AppConfig& config) {
    if (config.storage.mysql.enabled) {
        auto pool = std::make_shared<txbind::storage::ConnectionPool>(
            txbind::storage::OptionsFromConfig(config.storage.mysql));
        TXBIND_LOG_INFO("Using MySQL backend {}:{}", config.storage.mysql.host, config.storage.mysql.port);
        return std::make_shared<txbind::storage::MySqlResourceFactory>(std::move(pool));
    }
    auto options = txbind::storage::MemoryOptionsFromConfig(config.storage.memory);
    TXBIND_LOG_INFO("Using in-memory backend with {} connections", options.pool_size);
    return std::make_shared<txbind::storage::MemoryResourcePool>(options);
}

} // namespace

int main(int argc, char** argv) {
    // 命令行参数优先, 否则按 TXBIND_CONFIG 或内置示例配置加载
    const std::string config_path = argc > 1 ? argv[1] : "";

    txbind::common::AppConfig config;
    try {
        config = config_path.empty() ? txbind::common::ConfigLoader::LoadFromEnvOrDefault()
                                     : txbind::common::ConfigLoader::Load(config_path);
    } catch (const std::exception& ex) {
        std::fprintf(stderr, "Failed to load config: %s\n", ex.what());
        return EXIT_FAILURE;
    }

    txbind::common::InitLogger(config.logging);
    TXBIND_LOG_INFO("txbind demo starting");

    auto factory = MakeFactory(config);
    txbind::core::ResourceTransactionManager manager(factory, txbind::core::MakeManagerConfig(config.transaction));
    txbind::core::TransactionContext context;

    txbind::core::TransactionDefinition outer_definition;
    outer_definition.name = "demo-outer";
    outer_definition.isolation_level = txbind::core::isolation::kSerializable;

    int exit_code = EXIT_SUCCESS;
    {
        txbind::core::TransactionScope outer(manager, context, outer_definition);
        auto status = outer.Begin();
        if (!status.IsOk()) {
            TXBIND_LOG_ERROR("Begin failed: {}", status.ToString());
            txbind::common::ShutdownLogger();
            return EXIT_FAILURE;
        }
        txbind::core::TransactionalResource* resource = outer.Resource();
        PrintResource("begin", *resource);

        // 内层作用域加入外层事务, 不改动连接设置
        txbind::core::TransactionDefinition inner_definition;
        inner_definition.name = "demo-inner";
        status = txbind::core::ExecuteInTransaction(
            manager, context, inner_definition, [resource](txbind::core::TransactionStatus& inner) {
                std::printf("inner    participating=%s\n", inner.IsNewTransaction() ? "no" : "yes");
                PrintResource("inner", *resource);
                return txbind::common::Status::OK();
            });
        if (!status.IsOk()) {
            TXBIND_LOG_ERROR("Inner scope failed: {}", status.ToString());
            exit_code = EXIT_FAILURE;
        }

        status = outer.Commit();
        if (!status.IsOk()) {
            TXBIND_LOG_ERROR("Commit failed: {}", status.ToString());
            exit_code = EXIT_FAILURE;
        }
    }

    // 提交后连接已归还, 重新借出检查设置是否恢复
    auto resource_or = factory->Acquire();
    if (resource_or.IsOk()) {
        PrintResource("after", *resource_or.Value());
    } else {
        TXBIND_LOG_ERROR("Could not reacquire resource: {}", resource_or.GetStatus().Message());
        exit_code = EXIT_FAILURE;
    }

    TXBIND_LOG_INFO("txbind demo finished");
    txbind::common::ShutdownLogger();
    return exit_code;
}
