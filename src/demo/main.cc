#include <algorithm>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>

// Project includes
#include "common/configuration.h"
#include "chunk/chunk_message_channel_writer.h"
#include "chunk/queue_channel.h"
#include "demo/loopback_worker.h"

using namespace RemoteChunk;

namespace {

constexpr char kNextItemKey[] = "demo.next_item";

using StringWriter = ChunkMessageChannelWriter<std::string>;

/**
 * Write items [begin, total) in transactions of commit_interval items,
 * flushing and checkpointing after each one.
 * @param stop_after_chunks Return early once this many chunks were sent (0 = never)
 * @return Index of the first item not yet written
 */
size_t WriteItems(StringWriter& writer, ExecutionContext& checkpoint,
                  size_t begin, size_t total, size_t commit_interval,
                  uint64_t stop_after_chunks, uint64_t& txn_seq) {
    size_t i = begin;
    while (i < total) {
        TransactionId txn{++txn_seq};
        size_t end = std::min(i + commit_interval, total);
        for (; i < end; ++i) {
            writer.Write(txn, "item-" + std::to_string(i));
        }
        writer.Flush(txn);

        checkpoint.PutLong(kNextItemKey, i);
        writer.Update(checkpoint);

        if (stop_after_chunks > 0 && writer.chunks_sent() >= stop_after_chunks) {
            break;
        }
    }
    return i;
}

std::optional<cxxopts::ParseResult> ParseArgs(cxxopts::Options& options, int argc, char* argv[]) {
    try {
        return options.parse(argc, argv);
    } catch (const std::exception& e) {
        LOG(ERROR) << "Invalid arguments: " << e.what();
        return std::nullopt;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    // Initialize logging
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();
    FLAGS_logtostderr = 1; // log only to console, no files.

    // Setup command line options
    cxxopts::Options options("remote_chunk_demo", "Remote chunking coordinator demo");

    options.add_options()
        ("c,config", "YAML configuration file", cxxopts::value<std::string>())
        ("n,items", "Number of items to write", cxxopts::value<size_t>()->default_value("100"))
        ("i,commit_interval", "Items per transaction (one chunk per transaction)",
            cxxopts::value<size_t>()->default_value("10"))
        ("j,job_id", "Job id stamped on every chunk", cxxopts::value<int64_t>()->default_value("1"))
        ("t,throttle_limit", "Maximum chunks in flight", cxxopts::value<int>())
        ("d,drain_max_attempts", "Poll attempts for the bounded drain", cxxopts::value<int>())
        ("p,poll_interval_ms", "Poll interval of throttle and drain", cxxopts::value<int>())
        ("w,workers", "Loopback worker threads", cxxopts::value<int>())
        ("fail_after", "Answer FAILED after this many chunks (0 = never)",
            cxxopts::value<uint64_t>()->default_value("0"))
        ("restart_after", "Abandon the first attempt after this many chunks and resume from its checkpoint (0 = no restart)",
            cxxopts::value<uint64_t>()->default_value("0"))
        ("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
        ("h,help", "Print usage");

    auto parsed = ParseArgs(options, argc, argv);
    if (!parsed.has_value()) {
        std::cerr << options.help() << std::endl;
        return 1;
    }
    const cxxopts::ParseResult& result = *parsed;
    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }
    FLAGS_v = result["log_level"].as<int>();

    // Defaults < YAML < command line < environment
    Configuration& configuration = Configuration::getInstance();
    if (result.count("config") && !configuration.loadFromFile(result["config"].as<std::string>())) {
        return 1;
    }
    configuration.overrideFromCommandLine(argc, argv);
    if (!configuration.validate()) {
        for (const auto& error : configuration.getValidationErrors()) {
            LOG(ERROR) << "Invalid configuration: " << error;
        }
        return 1;
    }
    const RemoteChunkConfig& config = configuration.config();
    CoordinatorOptions coordinator_options = configuration.getCoordinatorOptions();

    size_t total_items = result["items"].as<size_t>();
    size_t commit_interval = std::max<size_t>(1, result["commit_interval"].as<size_t>());
    JobId job_id = result["job_id"].as<int64_t>();
    uint64_t fail_after = result["fail_after"].as<uint64_t>();
    uint64_t restart_after = result["restart_after"].as<uint64_t>();

    auto send_timeout = std::chrono::milliseconds(config.channel.send_timeout_ms.get());
    auto requests = std::make_shared<RequestChannel<std::string>>(config.channel.request_capacity.get(), send_timeout);
    auto replies = std::make_shared<ReplyChannel>(config.channel.reply_capacity.get(), send_timeout);

    LoopbackWorker<std::string> workers(requests, replies, config.demo.workers.get(),
            std::chrono::milliseconds(config.demo.worker_delay_ms.get()));
    if (fail_after > 0) {
        workers.FailAfter(fail_after);
    }
    workers.Start();

    LOG(INFO) << "Writing " << total_items << " item(s) in chunks of " << commit_interval
              << ", throttle limit " << coordinator_options.throttle_limit;

    ExecutionContext checkpoint;
    uint64_t txn_seq = 0;
    StepOutcome outcome;

    try {
        if (restart_after > 0) {
            // First attempt: abandoned without OnStepEnd, as if the process died.
            StringWriter first(std::make_shared<QueueChunkTarget<std::string>>(requests),
                               std::make_shared<QueueReplySource>(replies), coordinator_options);
            first.Open(checkpoint);
            first.OnStepStart(job_id, 0);
            size_t stopped_at = WriteItems(first, checkpoint, 0, total_items, commit_interval, restart_after, txn_seq);
            LOG(WARNING) << "Abandoning first attempt at item " << stopped_at << " after " << first.chunks_sent()
                         << " chunk(s) with " << first.progress().Outstanding() << " outstanding";
        }

        StringWriter writer(std::make_shared<QueueChunkTarget<std::string>>(requests),
                            std::make_shared<QueueReplySource>(replies), coordinator_options);
        writer.Open(checkpoint);
        size_t next_item = checkpoint.GetLong(kNextItemKey).value_or(0);
        writer.OnStepStart(job_id, 0);
        WriteItems(writer, checkpoint, next_item, total_items, commit_interval, 0, txn_seq);
        outcome = writer.OnStepEnd(StepStatus::COMPLETED);
        writer.Close(checkpoint);
    } catch (const ChunkError& e) {
        LOG(ERROR) << "Step failed (" << ErrorKindName(e.kind()) << "): " << e.what();
        outcome = StepOutcome::Failed(e.what(), e.kind());
    } catch (const std::exception& e) {
        LOG(ERROR) << "Step failed: " << e.what();
        outcome = StepOutcome::Failed(e.what());
    }

    workers.Stop();

    LOG(INFO) << "Step outcome: " << StepExitCodeName(outcome.code)
              << (outcome.description.empty() ? "" : " - " + outcome.description);
    LOG(INFO) << "Workers processed " << workers.chunks_processed() << " chunk(s), "
              << workers.items_processed() << " item(s)";

    return outcome.code == StepExitCode::FINISHED ? 0 : 1;
}
