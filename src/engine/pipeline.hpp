#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "config/diag_config.hpp"
#include "csv/record_view.hpp"
#include "csv/tokenizer.hpp"
#include "engine/engine.hpp"

namespace csvdx {

/// Splits [0, nb_elements) into nb_threads contiguous batches and runs
/// functor(start, end, thread_id) for each on its own thread; the last batch
/// takes the remainder. Joins before returning.
inline void parallel_for(std::size_t nb_elements,
                         const std::function<void(std::size_t start, std::size_t end, std::size_t thread_id)>& functor,
                         std::size_t nb_threads) {
    if (nb_threads == 0) nb_threads = 1;
    const std::size_t batch_size = nb_elements / nb_threads;
    const std::size_t batch_remainder = nb_elements % nb_threads;

    std::vector<std::thread> threads;
    threads.reserve(nb_threads);
    for (std::size_t i = 0; i + 1 < nb_threads; ++i) {
        const std::size_t start = i * batch_size;
        threads.emplace_back(functor, start, start + batch_size, i);
    }
    const std::size_t start = (nb_threads - 1) * batch_size;
    threads.emplace_back(functor, start, start + batch_size + batch_remainder, nb_threads - 1);

    for (auto& t : threads) t.join();
}

// Rows buffered per worker before a threaded block is profiled.
constexpr std::size_t default_rows_per_shard = 65536;

// Profiles one block of rows as contiguous shards on their own threads and
// folds the partials into `total` in shard order, so the result does not
// depend on scheduling. `first_row` is the global index of rows[0]; shard i
// samples with stream id `stream_base + i`.
inline void fold_block(engine& total, const std::vector<std::string>& header,
                       const std::vector<record>& rows, std::uint64_t first_row,
                       std::uint64_t stream_base, std::size_t threads) {
    if (rows.empty()) return;
    threads = std::max<std::size_t>(1, std::min(threads, rows.size()));
    const std::size_t batch_size = rows.size() / threads;

    std::vector<engine> parts(threads, engine(total.config()));
    for (std::size_t i = 0; i < threads; ++i) {
        parts[i].begin(header, first_row + static_cast<std::uint64_t>(i * batch_size), stream_base + i);
    }

    std::vector<std::exception_ptr> errors(threads);
    auto work = [&](std::size_t start, std::size_t end, std::size_t tid) {
        try {
            for (std::size_t r = start; r < end; ++r) parts[tid].consume(rows[r].view());
        } catch (...) {
            errors[tid] = std::current_exception();
        }
    };
    if (threads == 1) work(0, rows.size(), 0);
    else parallel_for(rows.size(), work, threads);

    for (const auto& e : errors) {
        if (e) std::rethrow_exception(e);
    }
    for (const auto& p : parts) total.merge(p);
}

// Sharded pass over rows already in memory.
inline dataset_report profile_records(const std::vector<std::string>& header,
                                      const std::vector<record>& rows,
                                      const diag_config& cfg,
                                      std::size_t threads = 1) {
    engine total(cfg);
    total.begin(header);
    fold_block(total, header, rows, 0, 1, threads);
    total.finalize();
    return total.report();
}

// One full pass: header, rows, finalize, diagnose. A read failure propagates
// as stream_error and no report is produced. With threads > 1 at most
// threads * rows_per_shard rows are held at a time.
inline dataset_report run_pass(csv_reader& reader, const diag_config& cfg, std::size_t threads = 1,
                               std::size_t rows_per_shard = default_rows_per_shard) {
    if (rows_per_shard == 0) throw std::invalid_argument("rows_per_shard == 0");
    const std::vector<std::string> header = reader.read_header();
    engine total(cfg);
    total.begin(header);
    record rec;

    if (threads <= 1) {
        while (reader.next(rec)) total.consume(rec.view());
        total.finalize();
        return total.report();
    }

    const std::size_t block_rows = threads * rows_per_shard;
    std::vector<record> block;
    block.reserve(block_rows);
    std::uint64_t first_row = 0;
    std::uint64_t stream_base = 1;
    for (;;) {
        block.clear();
        while (block.size() < block_rows && reader.next(rec)) block.push_back(std::move(rec));
        fold_block(total, header, block, first_row, stream_base, threads);
        first_row += block.size();
        stream_base += threads;
        if (block.size() < block_rows) break;
    }
    total.finalize();
    return total.report();
}

}
