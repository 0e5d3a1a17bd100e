#include "translation_loader.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <fstream>
#include <iterator>
#include <limits>
#include <mutex>
#include <sstream>
#include <stop_token>
#include <thread>
#include <utility>

#include <nlohmann/json.hpp>

namespace {

bool has_json_extension(const std::filesystem::path& path) {
    return path.extension() == ".json";
}

}  // namespace

bool load_translation_file(
    const std::filesystem::path& path,
    const ProjectClassifier& classifier,
    std::vector<TranslationEntry>& out_entries,
    std::string& error,
    const std::filesystem::path& base_dir,
    std::size_t* skipped_values
) {
    if (!has_json_extension(path)) {
        error = "File is not a JSON file: " + path.string();
        return false;
    }

    const auto open_path = base_dir.empty() || path.is_absolute() ? path : base_dir / path;
    std::ifstream in(open_path, std::ios::binary);
    if (!in) {
        error = "Cannot read file: " + path.string();
        return false;
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();

    nlohmann::json root;
    try {
        root = nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::parse_error& ex) {
        error = "Invalid JSON format in " + path.string() + ": " + ex.what();
        return false;
    }

    if (!root.is_object()) {
        error = "Root element is not a JSON object: " + path.string();
        return false;
    }

    const std::string file_path = path.generic_string();
    out_entries.reserve(out_entries.size() + root.size());
    for (const auto& [key, value] : root.items()) {
        if (!value.is_string()) {
            if (skipped_values != nullptr) {
                ++*skipped_values;
            }
            continue;
        }
        out_entries.push_back(make_translation_entry(file_path, key, value.get<std::string>(), classifier));
    }

    return true;
}

bool load_translations_parallel(
    const std::vector<std::filesystem::path>& files,
    const ProjectClassifier& classifier,
    const LoadOptions& options,
    std::vector<TranslationEntry>& out_entries,
    LoadStats& out_stats,
    std::string& error,
    const std::function<void(std::size_t, std::size_t)>& progress_callback
) {
    out_stats = LoadStats{};
    out_stats.files_total = files.size();
    out_entries.clear();

    if (files.empty()) {
        return true;
    }

    const std::size_t workers = options.workers == 0 ? 1 : options.workers;
    const std::size_t workers_used = std::min(workers, files.size());
    out_stats.workers_used = workers_used;

    std::atomic<std::size_t> next_index{0};
    std::atomic<std::size_t> completed{0};
    std::atomic<bool> failed{false};
    std::mutex collect_mutex;
    std::stop_source stop_source;

    const auto started = std::chrono::steady_clock::now();

    std::jthread reporter;
    if (progress_callback) {
        reporter = std::jthread([&](std::stop_token stop_token) {
            std::size_t last_completed = std::numeric_limits<std::size_t>::max();
            while (!stop_token.stop_requested()) {
                const std::size_t done = completed.load(std::memory_order_relaxed);
                if (done != last_completed) {
                    progress_callback(done, files.size());
                    last_completed = done;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            const std::size_t final_done = completed.load(std::memory_order_relaxed);
            if (final_done != last_completed) {
                progress_callback(final_done, files.size());
            }
        });
    }

    auto worker_fn = [&](std::stop_token stop_token) {
        while (!stop_token.stop_requested() && !failed.load(std::memory_order_relaxed)) {
            const std::size_t index = next_index.fetch_add(1, std::memory_order_relaxed);
            if (index >= files.size()) {
                return;
            }

            std::vector<TranslationEntry> local_entries;
            std::string local_error;
            std::size_t local_skipped = 0;
            bool ok = false;
            try {
                ok = load_translation_file(
                    files[index],
                    classifier,
                    local_entries,
                    local_error,
                    options.base_dir,
                    &local_skipped
                );
            } catch (const std::exception& ex) {
                local_error = "Unable to process " + files[index].string() + ": " + ex.what();
            }

            {
                std::lock_guard<std::mutex> lock(collect_mutex);
                if (ok) {
                    ++out_stats.files_loaded;
                    out_stats.values_skipped += local_skipped;
                    out_entries.insert(
                        out_entries.end(),
                        std::make_move_iterator(local_entries.begin()),
                        std::make_move_iterator(local_entries.end())
                    );
                } else {
                    out_stats.failures.push_back({files[index], local_error});
                    if (options.strict && !failed.exchange(true, std::memory_order_relaxed)) {
                        error = local_error;
                        stop_source.request_stop();
                    }
                }
            }
            completed.fetch_add(1, std::memory_order_relaxed);
        }
    };

    {
        std::vector<std::jthread> pool;
        pool.reserve(workers_used);
        for (std::size_t i = 0; i < workers_used; ++i) {
            pool.emplace_back(worker_fn, stop_source.get_token());
        }
        for (auto& thread : pool) {
            thread.join();
        }
    }

    if (reporter.joinable()) {
        reporter.request_stop();
        reporter.join();
    }

    if (failed.load(std::memory_order_relaxed)) {
        out_entries.clear();
        return false;
    }

    std::sort(out_entries.begin(), out_entries.end(), location_less);
    std::sort(out_stats.failures.begin(), out_stats.failures.end(), [](const auto& a, const auto& b) {
        return a.path < b.path;
    });

    out_stats.entries_total = out_entries.size();
    out_stats.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started
    );

    return true;
}
