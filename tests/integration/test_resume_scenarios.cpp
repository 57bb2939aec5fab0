/**
 * @file test_resume_scenarios.cpp
 * @brief Integration tests for interrupted batches resumed from the manifest
 */

#include "test_fixtures.h"

namespace kcenon::transfer_engine::test {

class ResumeScenarioTest : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        source_root_ = test_dir_ / "source";
        destination_root_ = test_dir_ / "destination";
        manifest_path_ = test_dir_ / "state" / "manifest.csv";
        backend_ = std::make_shared<local_storage_backend>();
    }

    void create_sources(int count) {
        for (int i = 0; i < count; ++i) {
            write_file("source/f" + std::to_string(i) + ".dat",
                       make_content(1000 + static_cast<std::size_t>(i), 'a'));
        }
    }

    auto requests(int count) const -> std::vector<transfer_request> {
        std::vector<transfer_request> out;
        for (int i = 0; i < count; ++i) {
            auto name = "f" + std::to_string(i) + ".dat";
            out.emplace_back((source_root_ / name).string(), (destination_root_ / name).string());
        }
        return out;
    }

    auto builder() -> batch_coordinator::builder {
        batch_coordinator::builder b(backend_, backend_);
        b.with_max_concurrency(2)
            .with_retry_policy(immediate_retry())
            .with_manifest(manifest_path_)
            .with_progress_interval(std::chrono::milliseconds(60000));
        return b;
    }

    auto last_status_by_source() -> std::map<std::string, transfer_status> {
        std::map<std::string, transfer_status> last;
        auto entries = manifest_store::read_entries(manifest_path_);
        EXPECT_TRUE(entries.has_value());
        if (entries) {
            for (const auto& e : entries.value()) {
                last[e.source] = e.status;
            }
        }
        return last;
    }

    std::filesystem::path source_root_;
    std::filesystem::path destination_root_;
    std::filesystem::path manifest_path_;
    std::shared_ptr<local_storage_backend> backend_;
    log_capture logs_{log_level::warn};
};

TEST_F(ResumeScenarioTest, InterruptedBatchCompletesOnResume) {
    constexpr int count = 12;
    create_sources(count);

    batch_coordinator* active = nullptr;
    std::atomic<int> finished{0};
    auto first = builder()
                     .with_max_concurrency(1)
                     .with_result_observer([&](const transfer_result&) {
                         if (++finished == 4 && active) {
                             active->cancel();
                         }
                     })
                     .build();
    ASSERT_TRUE(first.has_value());
    active = &first.value();

    auto interrupted = first.value().run(requests(count));
    ASSERT_TRUE(interrupted.has_value());
    EXPECT_TRUE(interrupted.value().cancelled);
    EXPECT_EQ(interrupted.value().exit_code(), 1);
    EXPECT_LT(interrupted.value().ok, static_cast<uint64_t>(count));
    auto copied_first = interrupted.value().ok;

    auto second = builder().with_resume(true).build();
    ASSERT_TRUE(second.has_value());
    auto resumed = second.value().run(requests(count));
    ASSERT_TRUE(resumed.has_value());

    EXPECT_FALSE(resumed.value().cancelled);
    EXPECT_EQ(resumed.value().resumed, copied_first);
    EXPECT_EQ(resumed.value().ok, count - copied_first);
    EXPECT_EQ(resumed.value().exit_code(), 0);

    for (int i = 0; i < count; ++i) {
        auto name = "f" + std::to_string(i) + ".dat";
        EXPECT_EQ(read_file(destination_root_ / name), read_file(source_root_ / name)) << name;
    }
    for (const auto& [source, status] : last_status_by_source()) {
        EXPECT_EQ(status, transfer_status::ok) << source;
    }
}

TEST_F(ResumeScenarioTest, ResumeAfterCrashMidRow) {
    constexpr int count = 3;
    create_sources(count);

    {
        auto first = builder().build();
        ASSERT_TRUE(first.has_value());
        ASSERT_TRUE(first.value().run(requests(count)).has_value());
    }

    // A crash while appending leaves an unterminated row behind.
    {
        std::ofstream out(manifest_path_, std::ios::app | std::ios::binary);
        out << (source_root_ / "f0.dat").string() << "," << (destination_root_ / "f0.dat").string()
            << ",2025-01-31T08:15:02Z";
    }

    auto second = builder().with_resume(true).build();
    ASSERT_TRUE(second.has_value());
    auto resumed = second.value().run(requests(count));
    ASSERT_TRUE(resumed.has_value());
    EXPECT_EQ(resumed.value().resumed, static_cast<uint64_t>(count));
    EXPECT_EQ(resumed.value().ok, 0u);
    EXPECT_TRUE(logs_.contains(log_level::warn, "partial"));

    // The file stays readable after the partial row was terminated.
    auto entries = manifest_store::read_entries(manifest_path_);
    ASSERT_TRUE(entries.has_value());
    EXPECT_EQ(entries.value().size(), static_cast<std::size_t>(count));
}

TEST_F(ResumeScenarioTest, FailedFileSucceedsOnceSourceAppears) {
    create_sources(2);
    auto all = requests(3);

    {
        auto first = builder().build();
        ASSERT_TRUE(first.has_value());
        auto summary = first.value().run(all);
        ASSERT_TRUE(summary.has_value());
        EXPECT_EQ(summary.value().ok, 2u);
        EXPECT_EQ(summary.value().errors, 1u);
    }
    EXPECT_EQ(last_status_by_source()[all[2].source], transfer_status::error);

    write_file("source/f2.dat", "late arrival");

    auto second = builder().with_resume(true).build();
    ASSERT_TRUE(second.has_value());
    auto summary = second.value().run(all);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary.value().resumed, 2u);
    EXPECT_EQ(summary.value().ok, 1u);
    EXPECT_EQ(summary.value().exit_code(), 0);
    EXPECT_EQ(read_file(destination_root_ / "f2.dat"), "late arrival");
    EXPECT_EQ(last_status_by_source()[all[2].source], transfer_status::ok);
}

TEST_F(ResumeScenarioTest, ResumeWithoutExistingManifestRunsEverything) {
    create_sources(3);

    auto coordinator = builder().with_resume(true).build();
    ASSERT_TRUE(coordinator.has_value());
    auto summary = coordinator.value().run(requests(3));
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary.value().resumed, 0u);
    EXPECT_EQ(summary.value().ok, 3u);
    EXPECT_TRUE(std::filesystem::exists(manifest_path_));
}

TEST_F(ResumeScenarioTest, SplitObjectResumesPerRange) {
    create_test_file("source/large.bin", 512 * 1024);
    auto source = (source_root_ / "large.bin").string();
    auto destination = (destination_root_ / "large.bin").string();

    range_split_policy split(128 * 1024, 4);
    split.min_component_size = 32 * 1024;

    // The first run loses the range starting at 256KiB.
    auto faulty = std::make_shared<fault_injecting_backend>(backend_);
    std::atomic<bool> drop_range{true};
    auto first_fn = [&](const transfer_unit& unit, unit_context& ctx) -> transfer_result {
        if (drop_range.load() && unit.range() && unit.range()->start == 256 * 1024) {
            auto now = std::chrono::system_clock::now();
            return transfer_result::make_error(unit, error(error_code::source_read_error), 0,
                                               now, now);
        }
        unit_runner runner(faulty, backend_);
        return runner.run(unit, ctx);
    };

    {
        auto first = builder().with_range_split(split).with_unit_function(first_fn).build();
        ASSERT_TRUE(first.has_value());
        auto summary = first.value().run({transfer_request(source, destination)});
        ASSERT_TRUE(summary.has_value());
        EXPECT_EQ(summary.value().ok, 3u);
        EXPECT_EQ(summary.value().errors, 1u);
    }
    EXPECT_NE(read_file(destination), read_file(source_root_ / "large.bin"));

    drop_range = false;
    auto second = builder()
                      .with_range_split(split)
                      .with_resume(true)
                      .with_unit_function(first_fn)
                      .build();
    ASSERT_TRUE(second.has_value());
    auto summary = second.value().run({transfer_request(source, destination)});
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary.value().resumed, 3u);
    EXPECT_EQ(summary.value().ok, 1u);
    EXPECT_EQ(summary.value().assembled, 1u);
    EXPECT_EQ(read_file(destination), read_file(source_root_ / "large.bin"));
}

}  // namespace kcenon::transfer_engine::test
