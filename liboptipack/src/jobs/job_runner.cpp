#include "../../include/job_runner.hpp"
#include "../../include/archive.hpp"
#include "../../include/errors.hpp"
#include "../../include/format_detector.hpp"
#include "../../include/logger.hpp"
#include <filesystem>
#include <new>
#include <unordered_set>

namespace optipack {

namespace {

    const char* runner_tag() {
        return "JobRunner";
    }

    struct ImageEntry {
        ArchiveMember member;
        ImageFormat format;
    };

    // "dir/b.jpg" -> "dir/b-1.jpg", "dir/b-2.jpg", ...
    std::string unique_name(const std::string& wanted, std::unordered_set<std::string>& used) {
        if (used.insert(wanted).second) {
            return wanted;
        }
        const std::filesystem::path path(wanted);
        const std::string stem = (path.parent_path() / path.stem()).generic_string();
        const std::string ext = path.extension().string();
        for (unsigned n = 1;; ++n) {
            std::string candidate = stem + "-" + std::to_string(n) + ext;
            if (used.insert(candidate).second) {
                return candidate;
            }
        }
    }

} // namespace

void JobRunner::fail(const JobId& job_id, EventChannel* channel, const std::string& reason) noexcept {
    if (!registry_.mark_failed(job_id, reason)) {
        return;
    }
    Logger::log(LogLevel::Warning, "Job " + job_id + " failed: " + reason, runner_tag());
    if (channel) {
        channel->publish(Failed{reason});
    }
}

void JobRunner::run(const JobId& job_id,
                    const ByteBuffer& archive,
                    const OptimizationOptions& options,
                    const std::stop_token worker_stop) noexcept {
    const std::shared_ptr<EventChannel> channel = channels_.find(job_id);
    if (!channel) {
        fail(job_id, nullptr, "event channel missing");
        return;
    }
    if (!registry_.mark_running(job_id)) {
        Logger::log(LogLevel::Debug, "Job " + job_id + " is no longer pending, not started", runner_tag());
        return;
    }
    Logger::log(LogLevel::Info, "Job " + job_id + " started (" + to_string(options) + ")", runner_tag());

    try {
        const std::stop_token job_stop = registry_.stop_token(job_id);

        std::vector<ImageEntry> images;
        for (auto& member : extract_entries(archive)) {
            if (!FormatDetector::is_image_entry(member.name, member.bytes)) {
                Logger::log(LogLevel::Debug, "Ignoring non-image entry " + member.name, runner_tag());
                continue;
            }
            const ImageFormat format = FormatDetector::detect(member.name, member.bytes);
            images.push_back(ImageEntry{std::move(member), format});
        }

        if (images.empty()) {
            fail(job_id, channel.get(), "archive contains no image entries");
            return;
        }

        const std::size_t total = images.size();
        registry_.set_total(job_id, total);

        // converted PNGs must not shadow an entry already in the batch
        std::unordered_set<std::string> used_names;
        for (const auto& image : images) {
            used_names.insert(image.member.name);
        }

        std::vector<ArchiveMember> outputs;
        outputs.reserve(total);

        for (std::size_t i = 0; i < total; ++i) {
            if (worker_stop.stop_requested() || job_stop.stop_requested()) {
                fail(job_id, channel.get(), "job cancelled");
                return;
            }

            auto& image = images[i];
            TransformOutput out = transformer_.transform(image.member.name, image.member.bytes,
                                                         image.format, options);
            image.member.bytes.clear();
            image.member.bytes.shrink_to_fit();

            if (out.result.converted) {
                out.result.output_name = unique_name(out.result.output_name, used_names);
            }
            outputs.push_back(ArchiveMember{out.result.output_name, std::move(out.bytes)});

            const int percent = static_cast<int>((i + 1) * 100 / total);
            registry_.record_result(job_id, out.result, percent);
            channel->publish(FileComplete{std::move(out.result)});
            channel->publish(Progress{percent});
        }

        const ByteBuffer result = create_archive(outputs);
        outputs.clear();
        const std::string artifact_id = artifacts_.store(result);

        if (!registry_.register_artifact(job_id, artifact_id)) {
            // failed concurrently; the Failed event has already been published
            artifacts_.remove(artifact_id);
            return;
        }
        channel->publish(Complete{artifact_id});
        Logger::log(LogLevel::Info, "Job " + job_id + " done: " + std::to_string(total) +
                    " image(s), artifact " + artifact_id, runner_tag());
    } catch (const std::bad_alloc&) {
        fail(job_id, channel.get(), "out of memory");
    } catch (const ArchiveError& e) {
        fail(job_id, channel.get(), std::string("archive error: ") + e.what());
    } catch (const std::exception& e) {
        fail(job_id, channel.get(), e.what());
    }
}

} // namespace optipack
