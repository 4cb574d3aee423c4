#include "sweep.hh"

#include <algorithm>
#include <atomic>
#include <ctime>
#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <numeric>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "unistd.h"

namespace opener
{
void starter_stats::record(const game_result& res)
{
    if (const auto turn = res.solved_turn())
        tries[*turn - 1]++;
    else
        failed++;
}

int starter_stats::total_games() const
{
    return solved_games() + failed;
}

int starter_stats::solved_games() const
{
    return std::accumulate(tries.begin(), tries.end(), 0);
}

double starter_stats::success_rate() const
{
    const int total = total_games();
    return total == 0 ? 0 : 100.0 * solved_games() / total;
}

double starter_stats::average_tries() const
{
    const int solved = solved_games();
    if (solved == 0)
        return 0;

    int sum = 0;
    for (int i = 0; i < NUM_ALLOWED_GUESSES; i++) {
        sum += (i + 1) * tries[i];
    }

    return static_cast<double>(sum) / solved;
}

std::vector<std::string> sample_targets(const std::vector<std::string>& words,
                                        size_t count, uint32_t seed)
{
    if (count > words.size()) {
        std::cerr << "warning: " << count << " targets requested but only "
                  << words.size() << " words available, using all of them" << std::endl;
        count = words.size();
    }

    std::vector<std::string> ret = words;
    std::mt19937 gen(seed);
    std::shuffle(ret.begin(), ret.end(), gen);
    ret.resize(count);

    return ret;
}

std::vector<starter_stats> run_sweep(const solver& solv,
                                     const std::vector<std::string>& starters,
                                     const std::vector<std::string>& targets,
                                     unsigned num_threads,
                                     const progress_fn& on_complete)
{
    if (num_threads == 0)
        num_threads = static_cast<unsigned>(std::max(::sysconf(::_SC_NPROCESSORS_ONLN), 1L));
    num_threads = std::min(num_threads, static_cast<unsigned>(std::max<size_t>(starters.size(), 1)));

    // Starters are handed out one at a time. Each worker accumulates its own
    // results which are only combined once every worker has joined.
    std::atomic<size_t> next_starter{0};
    // Guarded by progress_mutex.
    size_t num_completed = 0;
    std::mutex progress_mutex;

    std::vector<std::vector<std::pair<size_t, starter_stats>>> worker_results(num_threads);
    std::vector<std::exception_ptr> worker_errors(num_threads);

    auto work = [&] (unsigned worker) {
        try {
            for (size_t i = next_starter++; i < starters.size(); i = next_starter++) {
                starter_stats stats;
                stats.starter = starters[i];

                for (const std::string& target : targets) {
                    stats.record(solv.play(target, starters[i]));
                }

                if (on_complete) {
                    std::lock_guard guard(progress_mutex);
                    on_complete(stats, ++num_completed, starters.size());
                }

                worker_results[worker].emplace_back(i, std::move(stats));
            }
        } catch (...) {
            // Rethrown on the calling thread below.
            worker_errors[worker] = std::current_exception();
        }
    };

    std::vector<std::thread> threads;
    for (unsigned worker = 0; worker < num_threads; worker++) {
        threads.push_back(std::thread(work, worker));
    }

    // Join all worker threads.
    for (auto& thr : threads) {
        thr.join();
    }

    for (const std::exception_ptr& err : worker_errors) {
        if (err)
            std::rethrow_exception(err);
    }

    std::vector<starter_stats> ret(starters.size());
    for (auto& results : worker_results) {
        for (auto& [ index, stats ] : results) {
            ret[index] = std::move(stats);
        }
    }

    return ret;
}

void rank_stats(std::vector<starter_stats>& stats)
{
    std::ranges::stable_sort(stats, [] (const starter_stats& a, const starter_stats& b) {
        if (a.success_rate() != b.success_rate())
            return a.success_rate() > b.success_rate();
        if (a.average_tries() != b.average_tries())
            return a.average_tries() < b.average_tries();
        return a.starter < b.starter;
    });
}

std::string results_filename(const std::string& prefix, size_t num_targets, uint32_t seed)
{
    const std::time_t now = std::time(nullptr);
    std::tm local_time = {};
    ::localtime_r(&now, &local_time);

    std::ostringstream oss;
    oss << prefix << "_targets" << num_targets << "_seed" << seed << "_"
        << std::put_time(&local_time, "%Y-%m-%d_%H-%M-%S") << ".csv";
    return oss.str();
}

void write_results(const std::string& path, const std::vector<starter_stats>& stats)
{
    std::ofstream stream(path);
    if (!stream.is_open())
        throw std::runtime_error("Unable to open for writing: " + path);

    stream << "starter_word,failed";
    for (int turn = NUM_ALLOWED_GUESSES; turn >= 1; turn--) {
        stream << ",tries_" << turn;
    }
    stream << ",total_games,success_rate,avg_tries" << std::endl;

    for (const starter_stats& row : stats) {
        stream << row.starter << "," << row.failed;
        for (int turn = NUM_ALLOWED_GUESSES; turn >= 1; turn--) {
            stream << "," << row.tries[turn - 1];
        }
        stream << "," << row.total_games()
               << "," << row.success_rate()
               << "," << row.average_tries() << std::endl;
    }

    if (!stream)
        throw std::runtime_error("Failed writing: " + path);
}

void print_summary(const std::vector<starter_stats>& stats, size_t count)
{
    const size_t num = std::min(count, stats.size());

    for (size_t i = 0; i < num; i++) {
        const starter_stats& row = stats[i];

        std::cout << std::setw(3) << i + 1 << ". " << row.starter << ": "
                  << std::fixed << std::setprecision(1) << row.success_rate() << "% success, "
                  << std::setprecision(2) << row.average_tries() << " avg tries"
                  << std::defaultfloat << std::endl;
    }
}

void print_distribution(const starter_stats& stats)
{
    for (int i = 0; i < NUM_ALLOWED_GUESSES; i++) {
        std::cout << i + 1 << " : " << stats.tries[i] << std::endl;
    }

    std::cout << "x : " << stats.failed << std::endl;
    std::cout << "av: " << stats.average_tries() << std::endl;
}
} // namespace opener
