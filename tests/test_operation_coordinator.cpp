#include <gtest/gtest.h>
#include <memory>
#include <new>
#include <stdexcept>
#include <string>
#include "hasher/operation_coordinator.hpp"
#include "test_support.hpp"

using namespace DirectoryHasher;
using namespace DirectoryHasher::Core;

class OperationCoordinatorTest : public ::testing::Test {
protected:
    Testing::TemporaryDirectory scratch{"coordinator"};
    Logging::LoggingContext logging_context;
    std::unique_ptr<ThreadSystem::WorkerPool> pool;
    LogQueue queue;
    OperationTable table;
    Md5DigestProvider provider;
    std::unique_ptr<DirectoryTraversal> traversal;
    std::unique_ptr<OperationCoordinator> coordinator;

    void SetUp() override {
        pool = std::make_unique<ThreadSystem::WorkerPool>(2, logging_context);
        pool->start();
        traversal = std::make_unique<DirectoryTraversal>(*pool, queue, provider);
        coordinator = std::make_unique<OperationCoordinator>(table, *traversal, queue, Config::OperationsConfig{});
    }

    void TearDown() override {
        pool->shutdown();
    }
};

TEST_F(OperationCoordinatorTest, ConsumeOnEmptyQueueReportsNothing) {
    bool consumer_called = false;
    EXPECT_FALSE(coordinator->consume_next_log_line([&](const std::string&) { consumer_called = true; }));
    EXPECT_FALSE(consumer_called);
}

TEST_F(OperationCoordinatorTest, ConsumerReceivesFormattedLineOnce) {
    queue.push(LogEntry{"op1", "a b", "d41d8cd98f00b204e9800998ecf8427e"});

    std::string delivered_line;
    EXPECT_TRUE(coordinator->consume_next_log_line([&](const std::string& line) { delivered_line = line; }));
    EXPECT_EQ(delivered_line, "op1 a%20b d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_TRUE(queue.empty());
}

TEST_F(OperationCoordinatorTest, FailedConsumerRequeuesEntryAtHead) {
    queue.push(LogEntry{"op1", "first", "1"});
    queue.push(LogEntry{"op1", "second", "2"});

    EXPECT_THROW(coordinator->consume_next_log_line([](const std::string&) { throw std::bad_alloc(); }),
                 std::bad_alloc);
    ASSERT_EQ(queue.size(), 2u);

    std::string delivered_line;
    coordinator->consume_next_log_line([&](const std::string& line) { delivered_line = line; });
    EXPECT_EQ(delivered_line, "op1 first 1");
}

TEST_F(OperationCoordinatorTest, StartWaitAndReap) {
    scratch.write_file("tree/one.txt", "abc");
    OperationId operation_id = coordinator->start_operation((scratch.path() / "tree").string(), 9);
    EXPECT_EQ(operation_id, 9u);

    table.find(operation_id)->wait_until_finished();
    EXPECT_FALSE(coordinator->is_operation_running(operation_id));
    coordinator->stop_operation(operation_id);
    coordinator->reap_operation(operation_id);
    EXPECT_THROW(coordinator->is_operation_running(operation_id), std::invalid_argument);
}

TEST_F(OperationCoordinatorTest, InvalidRootRegistersNothing) {
    EXPECT_THROW(coordinator->start_operation((scratch.path() / "absent").string(), 1), std::invalid_argument);
    EXPECT_EQ(table.size(), 0u);
}
