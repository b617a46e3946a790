#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include "core/errors/agent_errors.hpp"
#include "deploy/pid_file.hpp"
#include "test_support.hpp"

namespace {

using agentrt::core::config::DeploymentMode;
using agentrt::core::errors::get_error;
using agentrt::core::errors::get_value;
using agentrt::core::errors::is_error;
using agentrt::deploy::DeploymentRecord;
using agentrt::deploy::PidFileStore;
using agentrt::testing::TempDir;

DeploymentRecord detached_record(pid_t pid) {
    DeploymentRecord record;
    record.mode = DeploymentMode::DetachedProcess;
    record.host = "127.0.0.1";
    record.port = 8200;
    record.pid = pid;
    record.deploy_id = agentrt::deploy::make_deploy_id(record.mode, record.host, record.port, pid);
    record.url = agentrt::deploy::make_service_url(record.host, record.port);
    return record;
}

TEST(PidFileStoreTest, WritesAndReadsRecord) {
    TempDir dir("pid_file");
    const PidFileStore store(dir.root() / "pids");
    const auto record = detached_record(4242);
    EXPECT_EQ(record.deploy_id, "detached_process_4242");

    const auto written = store.write(record);
    ASSERT_FALSE(is_error(written));
    EXPECT_TRUE(std::filesystem::exists(get_value(written)));
    EXPECT_EQ(get_value(written).filename().string(), "detached_process_4242.pid");

    const auto pid = store.read(record.deploy_id);
    ASSERT_FALSE(is_error(pid));
    EXPECT_EQ(get_value(pid), 4242);

    const auto reread = store.read_record(record.deploy_id);
    ASSERT_FALSE(is_error(reread));
    EXPECT_EQ(get_value(reread).url, "http://127.0.0.1:8200");
    EXPECT_EQ(get_value(reread).port, 8200);
    EXPECT_EQ(get_value(reread).mode, DeploymentMode::DetachedProcess);
}

TEST(PidFileStoreTest, RemoveIsIdempotent) {
    TempDir dir("pid_file");
    const PidFileStore store(dir.root());
    const auto record = detached_record(77);
    ASSERT_FALSE(is_error(store.write(record)));

    const auto first = store.remove(record.deploy_id);
    ASSERT_FALSE(is_error(first));
    EXPECT_TRUE(get_value(first));
    EXPECT_FALSE(std::filesystem::exists(dir.root() / "detached_process_77.json"));

    const auto second = store.remove(record.deploy_id);
    ASSERT_FALSE(is_error(second));
    EXPECT_FALSE(get_value(second));
}

TEST(PidFileStoreTest, ReportsMissingAndCorruptFiles) {
    TempDir dir("pid_file");
    const PidFileStore store(dir.root());

    const auto missing = store.read("detached_process_1");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "pid_file_missing");

    {
        std::ofstream out(dir.root() / "detached_process_2.pid");
        out << "not-a-pid\n";
    }
    const auto corrupt = store.read("detached_process_2");
    ASSERT_TRUE(is_error(corrupt));
    EXPECT_EQ(get_error(corrupt).code, "pid_file_corrupt");
}

TEST(PidFileStoreTest, RecordWithWrongFieldTypesIsCorrupt) {
    TempDir dir("pid_file");
    const PidFileStore store(dir.root());
    const DeploymentRecord record = detached_record(4242);
    ASSERT_FALSE(is_error(store.write(record)));

    {
        std::ofstream out(dir.root() / (record.deploy_id + ".json"), std::ios::trunc);
        out << R"({"deploy_id":"x","host":7,"port":"8200"})";
    }
    const auto reread = store.read_record(record.deploy_id);
    ASSERT_TRUE(is_error(reread));
    EXPECT_EQ(get_error(reread).code, "pid_file_corrupt");
}

TEST(PidFileStoreTest, RejectsUnsafeIds) {
    TempDir dir("pid_file");
    const PidFileStore store(dir.root());
    EXPECT_EQ(get_error(store.pid_path("../escape")).code, "invalid_deploy_id");
    EXPECT_EQ(get_error(store.log_path("")).code, "invalid_deploy_id");
}

TEST(PidFileStoreTest, RefusesRecordWithoutPid) {
    TempDir dir("pid_file");
    const PidFileStore store(dir.root());
    DeploymentRecord record = detached_record(1);
    record.pid.reset();
    EXPECT_TRUE(is_error(store.write(record)));
}

}  // namespace
