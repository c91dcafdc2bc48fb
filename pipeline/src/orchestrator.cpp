#include "chunkrelay/orchestrator.hpp"

#include "chunkrelay/errors.hpp"
#include "chunkrelay/upload_session.hpp"

#include <iomanip>
#include <iostream>
#include <variant>

namespace chunkrelay {

namespace {

constexpr std::size_t progress_every = 10;

double to_mib(std::uint64_t bytes) { return static_cast<double>(bytes) / (1024.0 * 1024.0); }

double to_gib(std::uint64_t bytes) { return static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0); }

} // namespace

double RunStatistics::elapsed_minutes() const {
    const auto elapsed = std::chrono::steady_clock::now() - started;
    return std::chrono::duration<double>(elapsed).count() / 60.0;
}

double RunStatistics::items_per_minute() const {
    const auto minutes = elapsed_minutes();
    return minutes > 0.0 ? static_cast<double>(concluded()) / minutes : 0.0;
}

Orchestrator::Orchestrator(const RelayConfig &config, RemoteClient &client, RateLimiter &limiter,
                           ThrottleRetryHandler &retry, Checkpoint &checkpoint, ContainerMap *container_map)
    : config_(config), client_(client), limiter_(limiter), retry_(retry), checkpoint_(checkpoint),
      container_map_(container_map), chunk_source_(config.chunk_size_bytes) {
    if (config_.parallel_uploads == 0) {
        throw std::invalid_argument("parallel uploads must be > 0");
    }
}

RunStatistics Orchestrator::run() {
    stats_ = RunStatistics{};
    std::cout << "relaying " << config_.source_chat << " (topic " << config_.source_topic.value_or("-") << ") -> "
              << config_.target_chat << " (topic " << config_.target_topic.value_or("-") << "), chunk "
              << config_.chunk_size_bytes / 1024 << " KiB, " << config_.parallel_uploads << " parallel uploads"
              << std::endl;
    try {
        const auto resume_after = checkpoint_.load().value_or(0);
        if (resume_after > 0) {
            std::cout << "resuming after item " << resume_after << std::endl;
        }
        auto cursor = client_.iterate_items(config_.source_chat, resume_after);
        while (auto item = cursor->next()) {
            if (item->id <= checkpoint_.last().value_or(resume_after)) {
                std::cerr << "skipping item " << item->id << " at or below checkpoint" << std::endl;
                continue;
            }
            if (!accepts(*item)) {
                continue;
            }
            const auto outcome = process_item(*item);
            checkpoint_.save(item->id);
            if (outcome == ItemOutcome::Succeeded) {
                ++stats_.succeeded;
                if (item->media) {
                    stats_.bytes_transferred += item->media->size_bytes;
                }
            } else {
                ++stats_.failed;
            }
            if (stats_.concluded() % progress_every == 0) {
                log_progress();
            }
        }
    } catch (const std::exception &e) {
        std::cerr << "run aborted: " << e.what() << std::endl;
        log_summary();
        throw;
    }
    log_summary();
    return stats_;
}

bool Orchestrator::accepts(const Item &item) const {
    if (!config_.source_topic) {
        return true;
    }
    return item.topic && *item.topic == *config_.source_topic;
}

ItemOutcome Orchestrator::process_item(const Item &item) {
    const auto reply_to = resolve_destination(item);
    try {
        switch (item.kind) {
        case MediaKind::Text:
            send_text(item, reply_to);
            break;
        case MediaKind::None:
            throw FatalError("unsupported item without text or media");
        default:
            if (!item.media || item.media->size_bytes == 0) {
                throw FatalError(std::string("unsupported ") + to_string(item.kind) + " without content");
            }
            if (item.media->size_bytes < config_.small_threshold_bytes) {
                send_small(item, reply_to);
            } else {
                send_streamed(item, reply_to);
            }
            break;
        }
    } catch (const std::exception &e) {
        std::cerr << "item " << item.id << " failed: " << e.what() << std::endl;
        return ItemOutcome::Failed;
    }
    return ItemOutcome::Succeeded;
}

std::optional<ContainerId> Orchestrator::resolve_destination(const Item &item) {
    if (!config_.auto_create_topics || !item.topic || container_map_ == nullptr) {
        return config_.target_topic;
    }
    if (auto mapped = container_map_->find(*item.topic)) {
        return mapped;
    }
    const auto title = "Topic " + *item.topic;
    ContainerId created;
    try {
        created = retry_.run_with_retries("create topic '" + title + "'", [&] {
            limiter_.wait_turn();
            return client_.create_topic(config_.target_chat, title);
        });
    } catch (const std::exception &e) {
        std::cerr << "failed to create topic '" << title << "': " << e.what() << std::endl;
        return config_.target_topic;
    }
    container_map_->put(*item.topic, created);
    std::cout << "created topic '" << title << "' (" << created << ")" << std::endl;
    return created;
}

SendRequest Orchestrator::make_request(const Item &item, const std::optional<ContainerId> &reply_to) const {
    SendRequest request;
    request.container = config_.target_chat;
    request.reply_to = reply_to;
    request.caption = item.text.value_or("");
    request.kind = item.kind;
    request.media = item.media;
    return request;
}

void Orchestrator::send_text(const Item &item, const std::optional<ContainerId> &reply_to) {
    send("item " + std::to_string(item.id), make_request(item, reply_to));
    std::cout << "item " << item.id << " sent (text)" << std::endl;
}

void Orchestrator::send_small(const Item &item, const std::optional<ContainerId> &reply_to) {
    const auto what = "item " + std::to_string(item.id);
    std::cout << "item " << item.id << ": small " << to_string(item.kind) << " " << item.media->display_name << " ("
              << std::fixed << std::setprecision(1) << to_mib(item.media->size_bytes) << " MiB)" << std::endl;
    auto request = make_request(item, reply_to);
    request.body = retry_.run_with_retries(what, [&] { return client_.read_small_object(item); });
    send(what, request);
    std::cout << "item " << item.id << " sent (" << to_string(item.kind) << ")" << std::endl;
}

void Orchestrator::send_streamed(const Item &item, const std::optional<ContainerId> &reply_to) {
    const auto what = "item " + std::to_string(item.id);
    const auto started = std::chrono::steady_clock::now();
    std::cout << "item " << item.id << ": streaming " << to_string(item.kind) << " " << item.media->display_name
              << " (" << std::fixed << std::setprecision(1) << to_mib(item.media->size_bytes) << " MiB)"
              << std::endl;

    auto reader = retry_.run(what, [&] { return chunk_source_.open(client_, item); });
    const auto session_id = UploadSession::new_session_id();
    auto request = make_request(item, reply_to);
    try {
        {
            // The session joins its workers on scope exit, before any discard.
            UploadSession session(client_, retry_, reader.total_parts(), config_.parallel_uploads, session_id);
            while (auto task = reader.next()) {
                session.schedule(task->index, std::move(task->data));
            }
            session.await_completion();
            request.body = session.finalize(item.media->display_name);
        }
        send(what, request);
    } catch (const std::exception &) {
        client_.discard_session(session_id);
        throw;
    }

    const auto &handle = std::get<RemoteObjectHandle>(request.body);
    const auto seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    const auto speed = seconds > 0.0 ? to_mib(item.media->size_bytes) / seconds : 0.0;
    std::cout << "item " << item.id << " sent (" << to_string(item.kind) << ", " << handle.total_parts()
              << " parts, crc32 " << handle.content_hash_hex() << ", " << std::fixed << std::setprecision(1)
              << seconds << " s, " << speed << " MiB/s)" << std::endl;
}

ItemId Orchestrator::send(const std::string &what, const SendRequest &request) {
    // Every attempt takes its own turn, so a replay after throttling is paced too.
    return retry_.run_with_retries(what, [&] {
        limiter_.wait_turn();
        return client_.send(request);
    });
}

void Orchestrator::log_progress() const {
    std::cout << "progress: " << stats_.succeeded << " ok | " << stats_.failed << " failed | " << std::fixed
              << std::setprecision(1) << stats_.items_per_minute() << " items/min | " << std::setprecision(2)
              << to_gib(stats_.bytes_transferred) << " GiB" << std::endl;
}

void Orchestrator::log_summary() const {
    std::cout << "run finished: " << stats_.succeeded << " succeeded, " << stats_.failed << " failed, " << std::fixed
              << std::setprecision(2) << to_gib(stats_.bytes_transferred) << " GiB in " << std::setprecision(1)
              << stats_.elapsed_minutes() << " min" << std::endl;
}

} // namespace chunkrelay
