/**
 * @file test_batch_coordinator.cpp
 * @brief Unit tests for batch planning, resume and failure handling
 */

#include "test_fixtures.h"

#include <condition_variable>
#include <future>
#include <stdexcept>

namespace kcenon::transfer_engine::test {

class BatchCoordinatorTest : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        source_store_ = std::make_shared<memory_storage_backend>();
        source_ = std::make_shared<fault_injecting_backend>(source_store_);
        destination_ = std::make_shared<memory_storage_backend>();
        manifest_path_ = test_dir_ / "manifest.csv";
    }

    auto builder() -> batch_coordinator::builder {
        batch_coordinator::builder b(source_, destination_);
        b.with_max_concurrency(2)
            .with_retry_policy(immediate_retry(3))
            .with_progress_interval(std::chrono::milliseconds(60000));
        return b;
    }

    static auto request(const std::string& name) -> transfer_request {
        return transfer_request("src/" + name, "dst/" + name);
    }

    auto rows() -> std::vector<manifest_entry> {
        auto entries = manifest_store::read_entries(manifest_path_);
        EXPECT_TRUE(entries.has_value());
        return entries ? entries.value() : std::vector<manifest_entry>{};
    }

    static auto find_row(const std::vector<manifest_entry>& entries, const std::string& source)
        -> const manifest_entry* {
        for (const auto& e : entries) {
            if (e.source == source) return &e;
        }
        return nullptr;
    }

    std::shared_ptr<memory_storage_backend> source_store_;
    std::shared_ptr<fault_injecting_backend> source_;
    std::shared_ptr<memory_storage_backend> destination_;
    std::filesystem::path manifest_path_;
    log_capture logs_{log_level::warn};
};

// =============================================================================
// Builder Tests
// =============================================================================

TEST_F(BatchCoordinatorTest, BuildRequiresBackends) {
    auto built = batch_coordinator::builder(nullptr, destination_).build();
    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code, error_code::invalid_argument);
}

TEST_F(BatchCoordinatorTest, ResumeRequiresManifest) {
    auto built = builder().with_resume(true).build();
    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code, error_code::invalid_configuration);
}

TEST_F(BatchCoordinatorTest, BuildRejectsInvalidConfiguration) {
    auto no_workers = builder().with_max_concurrency(0).build();
    ASSERT_FALSE(no_workers.has_value());
    EXPECT_EQ(no_workers.error().code, error_code::invalid_configuration);

    auto no_chunk = builder().with_chunk_size(0).build();
    ASSERT_FALSE(no_chunk.has_value());
    EXPECT_EQ(no_chunk.error().code, error_code::invalid_configuration);
}

// =============================================================================
// Batch Execution Tests
// =============================================================================

TEST_F(BatchCoordinatorTest, TransientFailureIsRetriedAndRecorded) {
    source_store_->put_object("src/a", make_content(10));
    source_store_->put_object("src/b", make_content(20, 'k'));
    source_store_->put_object("src/c", "");
    source_->fail_read("src/b", error(error_code::connection_timeout), 2);

    auto coordinator = builder().with_manifest(manifest_path_).build();
    ASSERT_TRUE(coordinator.has_value());

    auto summary = coordinator.value().run({request("a"), request("b"), request("c")});
    ASSERT_TRUE(summary.has_value());

    EXPECT_EQ(summary.value().total_units, 3u);
    EXPECT_EQ(summary.value().ok, 3u);
    EXPECT_EQ(summary.value().errors, 0u);
    EXPECT_EQ(summary.value().retries, 2u);
    EXPECT_EQ(summary.value().bytes_transferred, 30u);
    EXPECT_EQ(summary.value().exit_code(), 0);

    EXPECT_EQ(destination_->get_object("dst/a"), std::optional<std::string>(make_content(10)));
    EXPECT_EQ(destination_->get_object("dst/b"),
              std::optional<std::string>(make_content(20, 'k')));
    EXPECT_EQ(destination_->get_object("dst/c"), std::optional<std::string>(""));

    auto entries = rows();
    ASSERT_EQ(entries.size(), 3u);
    for (const auto& e : entries) {
        EXPECT_EQ(e.status, transfer_status::ok) << e.source;
    }
    auto* b = find_row(entries, "src/b");
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(b->bytes_transferred, 20u);
    EXPECT_NE(b->description.find("retries=2"), std::string::npos);
    EXPECT_EQ(b->source_size, std::optional<uint64_t>(20));
    EXPECT_TRUE(b->md5.has_value());
}

TEST_F(BatchCoordinatorTest, UnitErrorsDoNotStopTheBatch) {
    source_store_->put_object("src/a", "alpha");

    auto coordinator = builder().with_manifest(manifest_path_).build();
    ASSERT_TRUE(coordinator.has_value());

    auto summary = coordinator.value().run({request("missing"), request("a")});
    ASSERT_TRUE(summary.has_value());

    EXPECT_EQ(summary.value().ok, 1u);
    EXPECT_EQ(summary.value().errors, 1u);
    EXPECT_EQ(summary.value().exit_code(), 1);
    ASSERT_EQ(summary.value().failures.size(), 1u);
    EXPECT_EQ(summary.value().failures[0].source, "src/missing");
    EXPECT_EQ(summary.value().failures[0].err.code, error_code::object_not_found);

    auto text = summary.value().format_summary();
    EXPECT_NE(text.find("Failed transfers:"), std::string::npos);
    EXPECT_NE(text.find("src/missing -> dst/missing"), std::string::npos);

    auto* row = find_row(rows(), "src/missing");
    ASSERT_NE(row, nullptr);
    EXPECT_EQ(row->status, transfer_status::error);
    EXPECT_EQ(row->bytes_transferred, 0u);
}

TEST_F(BatchCoordinatorTest, InvalidRequestIsRecordedAsError) {
    source_store_->put_object("src/a", "alpha");

    auto coordinator = builder().with_manifest(manifest_path_).build();
    ASSERT_TRUE(coordinator.has_value());

    auto summary = coordinator.value().run({transfer_request("src/a", ""), request("a")});
    ASSERT_TRUE(summary.has_value());

    EXPECT_EQ(summary.value().total_units, 2u);
    EXPECT_EQ(summary.value().ok, 1u);
    EXPECT_EQ(summary.value().errors, 1u);
    EXPECT_EQ(summary.value().failures[0].err.code, error_code::invalid_argument);
    EXPECT_EQ(rows().size(), 2u);
}

TEST_F(BatchCoordinatorTest, StreamedRequests) {
    for (int i = 0; i < 20; ++i) {
        source_store_->put_object("src/f" + std::to_string(i), make_content(i));
    }

    auto coordinator = builder().with_max_pending(2).build();
    ASSERT_TRUE(coordinator.has_value());

    int next = 0;
    auto summary = coordinator.value().run([&]() -> std::optional<transfer_request> {
        if (next >= 20) {
            return std::nullopt;
        }
        return request("f" + std::to_string(next++));
    });
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary.value().ok, 20u);
    EXPECT_EQ(destination_->object_count(), 20u);
}

TEST_F(BatchCoordinatorTest, EmptyRequestSourceRejected) {
    auto coordinator = builder().build();
    ASSERT_TRUE(coordinator.has_value());

    auto summary = coordinator.value().run(request_source{});
    ASSERT_FALSE(summary.has_value());
    EXPECT_EQ(summary.error().code, error_code::invalid_argument);
}

TEST_F(BatchCoordinatorTest, ObserverSeesEveryResult) {
    source_store_->put_object("src/a", "alpha");
    source_store_->put_object("src/b", "beta");

    std::mutex mutex;
    std::vector<std::string> seen;
    auto coordinator = builder()
                           .with_result_observer([&](const transfer_result& r) {
                               std::lock_guard<std::mutex> lock(mutex);
                               seen.push_back(r.unit.source());
                           })
                           .build();
    ASSERT_TRUE(coordinator.has_value());

    auto summary = coordinator.value().run({request("a"), request("b")});
    ASSERT_TRUE(summary.has_value());
    std::sort(seen.begin(), seen.end());
    EXPECT_EQ(seen, (std::vector<std::string>{"src/a", "src/b"}));
}

TEST_F(BatchCoordinatorTest, ProgressCallbackReceivesFinalSnapshot) {
    source_store_->put_object("src/a", make_content(100));

    std::mutex mutex;
    std::optional<progress_snapshot> last;
    auto coordinator = builder()
                           .with_progress_callback([&](const progress_snapshot& s) {
                               std::lock_guard<std::mutex> lock(mutex);
                               last = s;
                           })
                           .build();
    ASSERT_TRUE(coordinator.has_value());

    ASSERT_TRUE(coordinator.value().run({request("a")}).has_value());
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->bytes_transferred, 100u);
    EXPECT_EQ(last->completed_units, 1u);
}

// =============================================================================
// Resume Tests
// =============================================================================

TEST_F(BatchCoordinatorTest, ResumeSkipsCompletedAndRetriesFailed) {
    source_store_->put_object("src/a", "alpha");
    source_->fail_stat("src/b", error(error_code::permission_denied));
    source_store_->put_object("src/b", "beta");

    {
        auto first = builder().with_manifest(manifest_path_).build();
        ASSERT_TRUE(first.has_value());
        auto summary = first.value().run({request("a"), request("b")});
        ASSERT_TRUE(summary.has_value());
        EXPECT_EQ(summary.value().ok, 1u);
        EXPECT_EQ(summary.value().errors, 1u);
    }

    destination_->remove_object("dst/a");
    std::vector<std::string> executed;
    std::mutex mutex;

    auto second = builder()
                      .with_manifest(manifest_path_)
                      .with_resume(true)
                      .with_result_observer([&](const transfer_result& r) {
                          if (r.status != transfer_status::skipped) {
                              std::lock_guard<std::mutex> lock(mutex);
                              executed.push_back(r.unit.source());
                          }
                      })
                      .build();
    ASSERT_TRUE(second.has_value());
    auto summary = second.value().run({request("a"), request("b")});
    ASSERT_TRUE(summary.has_value());

    EXPECT_EQ(summary.value().resumed, 1u);
    EXPECT_EQ(summary.value().skipped, 1u);
    EXPECT_EQ(summary.value().ok, 1u);
    EXPECT_EQ(summary.value().exit_code(), 0);
    EXPECT_EQ(executed, (std::vector<std::string>{"src/b"}));

    // The completed object was not copied again.
    EXPECT_FALSE(destination_->contains("dst/a"));
    EXPECT_TRUE(destination_->contains("dst/b"));

    auto entries = rows();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries.back().source, "src/b");
    EXPECT_EQ(entries.back().status, transfer_status::ok);
}

TEST_F(BatchCoordinatorTest, ResumeOfFinishedBatchDoesNothing) {
    source_store_->put_object("src/a", "alpha");
    source_store_->put_object("src/b", "beta");

    auto first = builder().with_manifest(manifest_path_).build();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(first.value().run({request("a"), request("b")}).has_value());
    auto rows_before = rows().size();

    auto second = builder().with_manifest(manifest_path_).with_resume(true).build();
    ASSERT_TRUE(second.has_value());
    auto summary = second.value().run({request("a"), request("b")});
    ASSERT_TRUE(summary.has_value());

    EXPECT_EQ(summary.value().resumed, 2u);
    EXPECT_EQ(summary.value().ok, 0u);
    EXPECT_EQ(summary.value().bytes_transferred, 0u);
    EXPECT_EQ(source_->read_count("src/a"), 1);
    EXPECT_EQ(rows().size(), rows_before);
}

TEST_F(BatchCoordinatorTest, ResumeWithCorruptManifestFails) {
    {
        std::ofstream out(manifest_path_);
        out << "not,a,manifest\n";
    }
    auto coordinator = builder().with_manifest(manifest_path_).with_resume(true).build();
    ASSERT_TRUE(coordinator.has_value());

    auto summary = coordinator.value().run({request("a")});
    ASSERT_FALSE(summary.has_value());
    EXPECT_EQ(summary.error().code, error_code::manifest_corrupt);
}

// =============================================================================
// Fatal Error Tests
// =============================================================================

TEST_F(BatchCoordinatorTest, DestinationProbeFailureIsFatal) {
    destination_->set_probe_error(error(error_code::connection_timeout, "no route"));

    auto coordinator = builder().build();
    ASSERT_TRUE(coordinator.has_value());
    auto summary = coordinator.value().run({request("a")});
    ASSERT_FALSE(summary.has_value());
    EXPECT_EQ(summary.error().code, error_code::destination_unreachable);
}

TEST_F(BatchCoordinatorTest, SourceAuthenticationFailureIsFatal) {
    source_->set_probe_error(error(error_code::authentication_failed, "bad token"));

    auto coordinator = builder().build();
    ASSERT_TRUE(coordinator.has_value());
    auto summary = coordinator.value().run({request("a")});
    ASSERT_FALSE(summary.has_value());
    EXPECT_EQ(summary.error().code, error_code::authentication_failed);
}

TEST_F(BatchCoordinatorTest, FatalUnitErrorAbortsBatch) {
    for (int i = 0; i < 5; ++i) {
        source_store_->put_object("src/f" + std::to_string(i), "data");
    }
    source_->fail_read("src/f0", error(error_code::authentication_failed, "token expired"));

    auto coordinator = builder().with_max_concurrency(1).build();
    ASSERT_TRUE(coordinator.has_value());

    std::vector<transfer_request> requests;
    for (int i = 0; i < 5; ++i) {
        requests.push_back(request("f" + std::to_string(i)));
    }
    auto summary = coordinator.value().run(requests);
    ASSERT_FALSE(summary.has_value());
    EXPECT_EQ(summary.error().code, error_code::authentication_failed);
}

// =============================================================================
// Splitting Tests
// =============================================================================

TEST_F(BatchCoordinatorTest, LargeObjectsAreSplitIntoRanges) {
    auto content = make_content(1000);
    source_store_->put_object("src/big", content);
    source_store_->put_object("src/small", "tiny");

    range_split_policy split(500, 4);
    split.min_component_size = 100;

    auto coordinator =
        builder().with_range_split(split).with_manifest(manifest_path_).with_chunk_size(64).build();
    ASSERT_TRUE(coordinator.has_value());

    auto summary = coordinator.value().run({request("big"), request("small")});
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary.value().total_units, 5u);
    EXPECT_EQ(summary.value().ok, 5u);
    EXPECT_EQ(summary.value().bytes_transferred, 1004u);
    EXPECT_EQ(destination_->get_object("dst/big"), std::optional<std::string>(content));

    int ranged_rows = 0;
    for (const auto& e : rows()) {
        if (e.range()) {
            ++ranged_rows;
            EXPECT_EQ(e.source, "src/big");
        }
    }
    EXPECT_EQ(ranged_rows, 4);
    EXPECT_EQ(summary.value().assembled, 1u);
}

TEST_F(BatchCoordinatorTest, SplitCopyReplacesLongerDestination) {
    source_store_->put_object("src/big", std::string(1000, 'N'));
    destination_->put_object("dst/big", std::string(3000, 'O'));

    range_split_policy split(100, 4);
    split.min_component_size = 1;

    auto coordinator = builder().with_range_split(split).with_manifest(manifest_path_).build();
    ASSERT_TRUE(coordinator.has_value());

    auto summary = coordinator.value().run({request("big")});
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary.value().ok, 4u);
    EXPECT_EQ(summary.value().errors, 0u);
    EXPECT_EQ(destination_->get_object("dst/big"),
              std::optional<std::string>(std::string(1000, 'N')));
}

TEST_F(BatchCoordinatorTest, SplitObjectIsRecordedWholeAfterVerification) {
    auto content = make_content(1000);
    source_store_->put_object("src/big", content);

    range_split_policy split(500, 4);
    split.min_component_size = 100;

    auto req = request("big");
    req.content_hash = checksum::md5(content);

    auto coordinator = builder().with_range_split(split).with_manifest(manifest_path_).build();
    ASSERT_TRUE(coordinator.has_value());

    auto summary = coordinator.value().run({req});
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary.value().errors, 0u);
    EXPECT_EQ(summary.value().assembled, 1u);
    EXPECT_NE(summary.value().format_summary().find("1 split object(s) assembled"),
              std::string::npos);

    auto entries = rows();
    ASSERT_EQ(entries.size(), 5u);
    const auto& whole = entries.back();
    EXPECT_FALSE(whole.range().has_value());
    EXPECT_EQ(whole.status, transfer_status::ok);
    EXPECT_EQ(whole.md5, std::optional<std::string>(checksum::md5(content)));
    EXPECT_EQ(whole.bytes_transferred, 1000u);
}

TEST_F(BatchCoordinatorTest, SplitObjectWithWrongHashIsReported) {
    source_store_->put_object("src/big", make_content(1000));

    range_split_policy split(500, 4);
    split.min_component_size = 100;

    auto req = request("big");
    req.content_hash = std::string(32, '0');

    auto coordinator = builder().with_range_split(split).with_manifest(manifest_path_).build();
    ASSERT_TRUE(coordinator.has_value());

    auto summary = coordinator.value().run({req});
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary.value().ok, 4u);
    EXPECT_EQ(summary.value().errors, 1u);
    EXPECT_EQ(summary.value().assembled, 0u);
    EXPECT_EQ(summary.value().exit_code(), 1);
    ASSERT_EQ(summary.value().failures.size(), 1u);
    EXPECT_EQ(summary.value().failures[0].err.code, error_code::checksum_mismatch);
    EXPECT_FALSE(summary.value().failures[0].range.has_value());

    auto entries = rows();
    ASSERT_EQ(entries.size(), 5u);
    EXPECT_FALSE(entries.back().range().has_value());
    EXPECT_EQ(entries.back().status, transfer_status::error);

    // The failed whole-object row discards the finished ranges.
    auto completed = manifest_store::load_completed(manifest_path_);
    ASSERT_TRUE(completed.has_value());
    EXPECT_TRUE(completed.value().empty());
}

TEST_F(BatchCoordinatorTest, ResumeSkipsAssembledObjectAsOneUnit) {
    source_store_->put_object("src/big", make_content(1000));

    range_split_policy split(500, 4);
    split.min_component_size = 100;

    {
        auto first = builder().with_range_split(split).with_manifest(manifest_path_).build();
        ASSERT_TRUE(first.has_value());
        auto summary = first.value().run({request("big")});
        ASSERT_TRUE(summary.has_value());
        EXPECT_EQ(summary.value().assembled, 1u);
    }

    std::atomic<int> executed{0};
    auto counting = [&](const transfer_unit& unit, unit_context&) -> transfer_result {
        ++executed;
        auto now = std::chrono::system_clock::now();
        return transfer_result::make_ok(unit, 0, now, now);
    };
    auto second = builder()
                      .with_range_split(split)
                      .with_manifest(manifest_path_)
                      .with_resume(true)
                      .with_unit_function(counting)
                      .build();
    ASSERT_TRUE(second.has_value());
    auto summary = second.value().run({request("big")});
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary.value().total_units, 1u);
    EXPECT_EQ(summary.value().resumed, 1u);
    EXPECT_EQ(summary.value().assembled, 0u);
    EXPECT_EQ(executed.load(), 0);
}

TEST_F(BatchCoordinatorTest, ResumeRerunsOnlyMissingRanges) {
    auto content = make_content(1000);
    source_store_->put_object("src/big", content);

    range_split_policy split(500, 4);
    split.min_component_size = 100;

    // Only the third range [500-750) fails.
    std::atomic<bool> fail_third{true};
    auto flaky = [&](const transfer_unit& unit, unit_context& ctx) -> transfer_result {
        if (fail_third.load() && unit.range() && unit.range()->start == 500) {
            auto now = std::chrono::system_clock::now();
            return transfer_result::make_error(unit, error(error_code::object_not_found), 0,
                                               now, now);
        }
        unit_runner runner(source_, destination_);
        return runner.run(unit, ctx);
    };

    {
        auto first = builder()
                         .with_range_split(split)
                         .with_manifest(manifest_path_)
                         .with_unit_function(flaky)
                         .build();
        ASSERT_TRUE(first.has_value());
        auto summary = first.value().run({request("big")});
        ASSERT_TRUE(summary.has_value());
        EXPECT_EQ(summary.value().ok, 3u);
        EXPECT_EQ(summary.value().errors, 1u);
    }

    fail_third = false;
    std::vector<uint64_t> rerun_starts;
    auto second = builder()
                      .with_range_split(split)
                      .with_manifest(manifest_path_)
                      .with_resume(true)
                      .with_unit_function(flaky)
                      .with_result_observer([&](const transfer_result& r) {
                          if (r.status == transfer_status::ok && r.unit.range()) {
                              rerun_starts.push_back(r.unit.range()->start);
                          }
                      })
                      .build();
    ASSERT_TRUE(second.has_value());
    auto summary = second.value().run({request("big")});
    ASSERT_TRUE(summary.has_value());

    EXPECT_EQ(summary.value().resumed, 3u);
    EXPECT_EQ(summary.value().ok, 1u);
    EXPECT_EQ(rerun_starts, (std::vector<uint64_t>{500}));
    EXPECT_EQ(destination_->get_object("dst/big"), std::optional<std::string>(content));
}

TEST_F(BatchCoordinatorTest, NoClobberSkipsExistingBeforeSplitting) {
    source_store_->put_object("src/big", make_content(1000));
    destination_->put_object("dst/big", "keep me");

    range_split_policy split(500, 4);
    split.min_component_size = 100;

    auto coordinator = builder().with_range_split(split).with_no_clobber(true).build();
    ASSERT_TRUE(coordinator.has_value());

    auto summary = coordinator.value().run({request("big")});
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary.value().total_units, 1u);
    EXPECT_EQ(summary.value().skipped, 1u);
    EXPECT_EQ(summary.value().resumed, 0u);
    EXPECT_EQ(destination_->get_object("dst/big"), std::optional<std::string>("keep me"));
}

// =============================================================================
// Cancellation Tests
// =============================================================================

TEST_F(BatchCoordinatorTest, CancelStopsBatchWithSummary) {
    for (int i = 0; i < 10; ++i) {
        source_store_->put_object("src/f" + std::to_string(i), "data");
    }

    std::promise<void> first_started;
    std::atomic<bool> signalled{false};
    auto blocking = [&](const transfer_unit& unit, unit_context& ctx) -> transfer_result {
        if (!signalled.exchange(true)) {
            first_started.set_value();
        }
        while (!ctx.cancel.is_cancelled()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        auto now = std::chrono::system_clock::now();
        return transfer_result::make_error(unit, error(error_code::transfer_cancelled), 0, now,
                                           now);
    };

    auto coordinator = builder()
                           .with_max_concurrency(1)
                           .with_unit_function(blocking)
                           .with_manifest(manifest_path_)
                           .build();
    ASSERT_TRUE(coordinator.has_value());
    auto* running = &coordinator.value();

    std::vector<transfer_request> requests;
    for (int i = 0; i < 10; ++i) {
        requests.push_back(request("f" + std::to_string(i)));
    }
    auto outcome = std::async(std::launch::async, [running, &requests] {
        return running->run(requests);
    });

    first_started.get_future().wait();
    running->cancel();

    auto summary = outcome.get();
    ASSERT_TRUE(summary.has_value());
    EXPECT_TRUE(summary.value().cancelled);
    EXPECT_EQ(summary.value().ok, 0u);
    EXPECT_EQ(summary.value().exit_code(), 1);
    EXPECT_EQ(summary.value().errors + summary.value().not_started,
              summary.value().total_units);
    EXPECT_NE(summary.value().format_summary().find("[cancelled]"), std::string::npos);

    // The unit interrupted mid-flight is recorded; dropped units are not.
    auto entries = rows();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].source, "src/f0");
    EXPECT_EQ(entries[0].status, transfer_status::error);
    EXPECT_NE(entries[0].description.find("cancelled"), std::string::npos);
}

TEST_F(BatchCoordinatorTest, CancelBeforeRunCancelsThatRun) {
    source_store_->put_object("src/a", "aaa");

    auto coordinator = builder().build();
    ASSERT_TRUE(coordinator.has_value());
    coordinator.value().cancel();

    auto summary = coordinator.value().run({request("a")});
    ASSERT_TRUE(summary.has_value());
    EXPECT_TRUE(summary.value().cancelled);
    EXPECT_EQ(summary.value().ok, 0u);
    EXPECT_FALSE(destination_->get_object("dst/a").has_value());

    // The pending cancel is consumed; the next run copies normally.
    auto again = coordinator.value().run({request("a")});
    ASSERT_TRUE(again.has_value());
    EXPECT_FALSE(again.value().cancelled);
    EXPECT_EQ(again.value().ok, 1u);
}

TEST_F(BatchCoordinatorTest, ThrowingRequestSourceStopsBatch) {
    source_store_->put_object("src/a", "aaa");

    auto coordinator = builder().build();
    ASSERT_TRUE(coordinator.has_value());

    int calls = 0;
    auto outcome = coordinator.value().run([&calls]() -> std::optional<transfer_request> {
        if (calls++ == 0) {
            return request("a");
        }
        throw std::runtime_error("listing failed");
    });
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().code, error_code::internal_error);
    EXPECT_NE(outcome.error().message.find("listing failed"), std::string::npos);

    // No executor is left registered once run() returns.
    coordinator.value().cancel();
    auto again = coordinator.value().run({request("a")});
    ASSERT_TRUE(again.has_value());
    EXPECT_TRUE(again.value().cancelled);
}

}  // namespace kcenon::transfer_engine::test
