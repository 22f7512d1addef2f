/**
 * @file service_config.hpp
 * @brief Tunables of the OptimizationService.
 */

#ifndef OPTIPACK_SERVICE_CONFIG_HPP
#define OPTIPACK_SERVICE_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <thread>

namespace optipack {

    struct ServiceConfig {
        ///< Workers running jobs. 0 selects the hardware concurrency.
        unsigned worker_threads = std::thread::hardware_concurrency();
        ///< Queued plus running jobs accepted before submit() refuses. 0 = no limit.
        std::size_t max_pending_jobs = 0;
        ///< Where finished archives are written.
        std::filesystem::path data_dir = std::filesystem::temp_directory_path() / "optipack";
        ///< Lifetime of a Done or Failed job and its artifact.
        std::chrono::seconds retention{3600};
        ///< How long an artifact stays fetchable after its first retrieval.
        std::chrono::seconds download_grace{60};
        ///< A running job nobody ever attached to is failed after this long.
        std::chrono::seconds unattended_timeout{600};
        ///< Period of the background cleanup pass. 0 disables the reaper thread.
        std::chrono::milliseconds reaper_interval{5000};
        ///< Retained events per job before superseded Progress events are compacted.
        std::size_t channel_backlog = 1024;
        ///< Idle time after which a stream writes a keepalive frame.
        std::chrono::milliseconds keepalive_interval{10000};
    };

} // namespace optipack

#endif // OPTIPACK_SERVICE_CONFIG_HPP
