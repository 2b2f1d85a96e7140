#include <gtest/gtest.h>
#include <filesystem>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>
#include <sys/stat.h>
#include "hasher/directory_traversal.hpp"
#include "test_support.hpp"

using namespace DirectoryHasher;
using namespace DirectoryHasher::Core;

// ============================================================================
// TEST FIXTURE
// ============================================================================

class DirectoryTraversalTest : public ::testing::Test {
protected:
    Testing::TemporaryDirectory scratch{"traversal"};
    Logging::LoggingContext logging_context;
    std::unique_ptr<ThreadSystem::WorkerPool> pool;
    LogQueue queue;
    Md5DigestProvider provider{4096};
    std::unique_ptr<DirectoryTraversal> traversal;

    void SetUp() override {
        pool = std::make_unique<ThreadSystem::WorkerPool>(3, logging_context);
        pool->start();
        traversal = std::make_unique<DirectoryTraversal>(*pool, queue, provider);
    }

    void TearDown() override {
        pool->shutdown();
    }

    std::shared_ptr<HashOperation> run_to_completion(OperationId operation_id) {
        auto operation = std::make_shared<HashOperation>(operation_id, DirectoryTraversal::validate_root(scratch.path().string()));
        traversal->start(operation);
        operation->wait_until_finished();
        return operation;
    }

    // Relative path to digest for every queued line
    std::map<std::string, std::string> drain_results() {
        std::map<std::string, std::string> results;
        LogEntry entry;
        while (queue.try_pop(entry)) {
            EXPECT_TRUE(results.emplace(entry.relative_path, entry.digest_hex).second) << entry.relative_path;
        }
        return results;
    }
};

// ============================================================================
// ROOT VALIDATION
// ============================================================================

TEST_F(DirectoryTraversalTest, ValidateRootReturnsAbsoluteNormalizedPath) {
    scratch.make_directory("nested");
    std::filesystem::path validated = DirectoryTraversal::validate_root((scratch.path() / "nested" / "..").string());
    EXPECT_TRUE(validated.is_absolute());
    EXPECT_EQ(std::filesystem::canonical(validated), std::filesystem::canonical(scratch.path()));
}

TEST_F(DirectoryTraversalTest, ValidateRootRejectsMissingEmptyAndFilePaths) {
    scratch.write_file("plain.txt", "x");
    EXPECT_THROW(DirectoryTraversal::validate_root(""), std::invalid_argument);
    EXPECT_THROW(DirectoryTraversal::validate_root((scratch.path() / "absent").string()), std::invalid_argument);
    EXPECT_THROW(DirectoryTraversal::validate_root((scratch.path() / "plain.txt").string()), std::invalid_argument);
}

// ============================================================================
// TRAVERSAL
// ============================================================================

TEST_F(DirectoryTraversalTest, HashesEveryRegularFileRecursively) {
    scratch.write_file("top.txt", "abc");
    scratch.write_file("a/empty.bin", "");
    scratch.write_file("a/b/c/deep.txt", "The quick brown fox jumps over the lazy dog");

    auto operation = run_to_completion(3);
    EXPECT_EQ(operation->state(), OperationState::COMPLETED);
    EXPECT_EQ(operation->hashed_file_count(), 3u);
    EXPECT_EQ(operation->pending_work(), 0u);

    auto results = drain_results();
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results["top.txt"], "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(results["a/empty.bin"], "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(results["a/b/c/deep.txt"], "9e107d9d372bb6826bd81d3542a419d6");
}

TEST_F(DirectoryTraversalTest, EntriesCarryOperationTag) {
    scratch.write_file("one.txt", "1");
    run_to_completion(12);

    LogEntry entry;
    ASSERT_TRUE(queue.try_pop(entry));
    EXPECT_EQ(entry.tag, "op12");
}

TEST_F(DirectoryTraversalTest, EmptyDirectoryCompletesWithoutLines) {
    scratch.make_directory("only/empty/dirs");
    auto operation = run_to_completion(1);
    EXPECT_EQ(operation->state(), OperationState::COMPLETED);
    EXPECT_TRUE(queue.empty());
}

TEST_F(DirectoryTraversalTest, SymbolicLinksAreNotFollowed) {
    Testing::TemporaryDirectory outside{"outside"};
    outside.write_file("secret.txt", "outside");
    scratch.write_file("real.txt", "inside");
    std::filesystem::create_symlink(outside.path() / "secret.txt", scratch.path() / "file_link");
    std::filesystem::create_directory_symlink(outside.path(), scratch.path() / "dir_link");
    std::filesystem::create_directory_symlink(scratch.path(), scratch.path() / "loop");

    auto operation = run_to_completion(2);
    EXPECT_EQ(operation->state(), OperationState::COMPLETED);
    EXPECT_EQ(operation->skipped_entry_count(), 3u);

    auto results = drain_results();
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results.count("real.txt"), 1u);
}

TEST_F(DirectoryTraversalTest, UnreadableFileIsCountedNotFatal) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "permission bits are not enforced for root";
    }
    Config::LoggingConfig logging_config;
    logging_config.console_output = true;
    logging_context.async_logger = std::make_shared<Logging::AsyncLogger>(logging_config);

    scratch.write_file("readable.txt", "ok");
    std::filesystem::path locked = scratch.write_file("locked.txt", "no");
    ::chmod(locked.c_str(), 0);

    auto operation = run_to_completion(4);
    ::chmod(locked.c_str(), S_IRUSR | S_IWUSR);

    std::vector<std::string> diagnostics;
    logging_context.async_logger->collect_all_available_messages(diagnostics);
    bool reason_logged = false;
    for (const std::string& diagnostic : diagnostics) {
        if (diagnostic.find("Cannot hash locked.txt: cannot open") != std::string::npos) {
            reason_logged = true;
            EXPECT_NE(diagnostic.find("ermission denied"), std::string::npos) << diagnostic;
        }
    }
    EXPECT_TRUE(reason_logged);

    EXPECT_EQ(operation->state(), OperationState::COMPLETED);
    EXPECT_EQ(operation->failed_file_count(), 1u);
    auto results = drain_results();
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results.count("readable.txt"), 1u);
}

TEST_F(DirectoryTraversalTest, StopBeforeWorkStartsProducesNothing) {
    for (int file_index = 0; file_index < 20; ++file_index) {
        scratch.write_file("d/f" + std::to_string(file_index), "content");
    }

    auto operation = std::make_shared<HashOperation>(5, DirectoryTraversal::validate_root(scratch.path().string()));
    operation->request_stop();
    traversal->start(operation);
    operation->wait_until_finished();

    EXPECT_EQ(operation->state(), OperationState::CANCELLED);
    EXPECT_TRUE(queue.empty());
}

TEST_F(DirectoryTraversalTest, RootRemovedAfterValidationFails) {
    std::filesystem::path doomed_root = scratch.make_directory("doomed");
    auto operation = std::make_shared<HashOperation>(6, DirectoryTraversal::validate_root(doomed_root.string()));
    std::filesystem::remove_all(doomed_root);

    traversal->start(operation);
    operation->wait_until_finished();
    EXPECT_EQ(operation->state(), OperationState::FAILED);
}

TEST_F(DirectoryTraversalTest, StartAfterPoolShutdownThrows) {
    pool->shutdown();
    auto operation = std::make_shared<HashOperation>(7, DirectoryTraversal::validate_root(scratch.path().string()));
    EXPECT_THROW(traversal->start(operation), std::runtime_error);
    EXPECT_EQ(operation->pending_work(), 0u);
    EXPECT_TRUE(operation->is_running());
}
