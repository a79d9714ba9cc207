#include <gtest/gtest.h>
#include "file_logger.hpp"
#include "access_control_engine.hpp"
#include "fake_packet_filter.hpp"
#include "temp_dir.hpp"
#include <chrono>
#include <filesystem>
#include <fcntl.h>
#include <sstream>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>

namespace {

std::vector<std::string> read_lines(const std::string& path) {
    std::istringstream in(TempDir::read_file(path));
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

// Strips the "[YYYY-mm-dd HH:MM:SS] " prefix of an audit line
std::string audit_event(const std::string& line) {
    if (line.size() < 22 || line[0] != '[' || line[20] != ']') {
        return "<malformed: " + line + ">";
    }
    return line.substr(22);
}

} // namespace

class FileLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = std::make_unique<TempDir>();
        service_path = dir->file("log/vnc-guard.log");
        audit_path = dir->file("vnc-protection.log");
    }

    void TearDown() override {
        if (g_file_logger.is_running()) {
            g_file_logger.drain();
            g_file_logger.stop();
        }
    }

    void start_global_logger() {
        FileLogger::FileConfig service;
        service.file_path = service_path;
        FileLogger::FileConfig audit;
        audit.file_path = audit_path;
        audit.min_level = FileLogger::LogLevel::LOG_DEBUG;

        ASSERT_TRUE(g_file_logger.initialize({{FileLogger::FileType::SERVICE_LOG, service},
                                              {FileLogger::FileType::AUDIT_LOG, audit}}));
        g_file_logger.start();
    }

    std::unique_ptr<TempDir> dir;
    std::string service_path;
    std::string audit_path;
};

TEST_F(FileLoggerTest, AuditTrailRecordsAttemptsThenBan) {
    start_global_logger();

    ListStore store(dir->file("whitelist"), dir->file("blacklist"));
    store.load();
    FakePacketFilter filter;
    RuleEngine rules(filter, 9901);
    AttemptTracker tracker;
    AccessControlEngine engine(store, rules, tracker, 3);

    const std::string attacker = "203.0.113.7";
    EXPECT_EQ(engine.on_failure_observed(attacker), FailureOutcome::ATTEMPT_RECORDED);
    EXPECT_EQ(engine.on_failure_observed(attacker), FailureOutcome::ATTEMPT_RECORDED);
    EXPECT_EQ(engine.on_failure_observed(attacker), FailureOutcome::DENIED);
    engine.undeny(attacker);

    g_file_logger.drain();

    auto lines = read_lines(audit_path);
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(audit_event(lines[0]), "Failed attempt from 203.0.113.7 (Attempt 1)");
    EXPECT_EQ(audit_event(lines[1]), "Failed attempt from 203.0.113.7 (Attempt 2)");
    EXPECT_EQ(audit_event(lines[2]), "Blocked 203.0.113.7 for VNC access");
    EXPECT_EQ(audit_event(lines[3]), "Unbanned 203.0.113.7 for VNC access");
}

TEST_F(FileLoggerTest, ServiceLinesCarryLevelAndSourceLocation) {
    start_global_logger();

    GUARD_LOG_DEBUG("below the threshold");
    GUARD_LOG_WARNING("log source missing");
    g_file_logger.drain();

    auto lines = read_lines(service_path);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("[WARNING] [test_file_logger.cpp:"), std::string::npos);
    EXPECT_NE(lines[0].find("] log source missing"), std::string::npos);
    EXPECT_TRUE(read_lines(audit_path).empty());
}

TEST_F(FileLoggerTest, CallsWhileStoppedAreDropped) {
    g_file_logger.write_audit_record("never written");
    EXPECT_FALSE(std::filesystem::exists(audit_path));
    EXPECT_EQ(g_file_logger.get_metrics().current_queue_size, 0u);
}

TEST_F(FileLoggerTest, RotatesIntoNumberedBackups) {
    FileLogger logger;
    FileLogger::FileConfig audit;
    audit.file_path = audit_path;
    audit.max_file_size = 256;
    audit.max_backup_files = 2;
    ASSERT_TRUE(logger.initialize({{FileLogger::FileType::AUDIT_LOG, audit}}));
    logger.start();

    for (int i = 0; i < 40; ++i) {
        logger.write_audit_record("Failed attempt from 198.51.100." + std::to_string(i) +
                                  " (Attempt 1)");
        if (i % 10 == 9) {
            logger.drain();
        }
    }
    logger.drain();
    auto metrics = logger.get_metrics();
    logger.stop();

    EXPECT_GE(metrics.file_rotations, 1u);
    EXPECT_TRUE(std::filesystem::exists(audit_path + ".1"));
    EXPECT_FALSE(std::filesystem::exists(audit_path + ".3"));
    EXPECT_EQ(metrics.dropped_entries, 0u);
}

TEST_F(FileLoggerTest, OverflowShedsServiceEntriesBeforeAudit) {
    // Opening a FIFO for writing blocks until a reader arrives, which parks
    // the writer thread while the queue fills up
    std::string fifo_path = dir->file("service.fifo");
    ASSERT_EQ(mkfifo(fifo_path.c_str(), 0600), 0);

    FileLogger logger(100);
    FileLogger::FileConfig service;
    service.file_path = fifo_path;
    FileLogger::FileConfig audit;
    audit.file_path = audit_path;
    ASSERT_TRUE(logger.initialize({{FileLogger::FileType::SERVICE_LOG, service},
                                   {FileLogger::FileType::AUDIT_LOG, audit}}));
    logger.start();

    FILE_LOG_INFO(logger, FileLogger::FileType::SERVICE_LOG, "writer parks here");
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    const int audit_records = 50;
    for (int i = 0; i < audit_records; ++i) {
        logger.write_audit_record("audit record " + std::to_string(i));
        for (int j = 0; j < 4; ++j) {
            FILE_LOG_INFO(logger, FileLogger::FileType::SERVICE_LOG, "chatter " + std::to_string(j));
        }
    }
    EXPECT_GT(logger.get_metrics().dropped_entries, 0u);

    std::string fifo_output;
    std::thread reader([&fifo_path, &fifo_output] {
        int fd = open(fifo_path.c_str(), O_RDONLY);
        if (fd < 0) {
            return;
        }
        char chunk[4096];
        ssize_t n;
        while ((n = read(fd, chunk, sizeof(chunk))) > 0) {
            fifo_output.append(chunk, static_cast<size_t>(n));
        }
        close(fd);
    });

    logger.drain();
    logger.stop();
    reader.join();

    auto lines = read_lines(audit_path);
    ASSERT_EQ(lines.size(), static_cast<size_t>(audit_records));
    for (int i = 0; i < audit_records; ++i) {
        EXPECT_EQ(audit_event(lines[i]), "audit record " + std::to_string(i));
    }
    EXPECT_NE(fifo_output.find("writer parks here"), std::string::npos);
}
