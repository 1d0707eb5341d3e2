/*
 * SCMGrid: Gridded Runs of a Single Column Model
 * Copyright (c) 2026 by the SCMGrid developers
 * 
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 * 
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 * 
 * You should have received a copy of the GNU Lesser General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <algorithm>
#include <functional>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>
#include <scmgrid/error.hpp>
#include <scmgrid/logging.hpp>
#include <scmgrid/Grid.hpp>

namespace scmgrid {

/** Runs a function on every tile using a fixed pool of worker
threads.  Each worker is dealt a fixed, disjoint set of tiles
before work starts; workers share nothing but the results list. */
template<class ResultT>
class TaskScheduler {
public:
    typedef std::function<ResultT (Tile const &)> TileFn;

    struct Outcome {
        /** (tile id, result), in order of completion */
        std::vector<std::pair<int, ResultT>> results;

        /** Tiles whose function threw */
        std::vector<int> failed_tiles;
    };

    int const num_workers;

    TaskScheduler(int _num_workers) : num_workers(std::max(1, _num_workers)) {}
    virtual ~TaskScheduler() {}

    /** Round-robin deal: worker w gets tiles w, w+N, w+2N... */
    std::vector<std::vector<size_t>> assign(size_t ntiles) const
    {
        std::vector<std::vector<size_t>> ret(num_workers);
        for (size_t i=0; i<ntiles; ++i) ret[i % num_workers].push_back(i);
        return ret;
    }

    Outcome run(std::vector<Tile> const &tiles, TileFn const &fn) const
    {
        Outcome outcome;
        std::mutex mutex;
        auto const assignment(assign(tiles.size()));

        auto worker([&](std::vector<size_t> const &mine) {
            for (size_t ix : mine) {
                Tile const &tile(tiles[ix]);
                try {
                    ResultT result(fn(tile));
                    std::lock_guard<std::mutex> lock(mutex);
                    outcome.results.push_back(std::make_pair(tile.id, std::move(result)));
                } catch(scmgrid::Exception const &) {
                    log_error("RUN", "tile #%d failed", tile.id);
                    std::lock_guard<std::mutex> lock(mutex);
                    outcome.failed_tiles.push_back(tile.id);
                } catch(std::exception const &exp) {
                    log_error("RUN", "tile #%d failed: %s", tile.id, exp.what());
                    std::lock_guard<std::mutex> lock(mutex);
                    outcome.failed_tiles.push_back(tile.id);
                }
            }
        });

        if (num_workers == 1) {
            worker(assignment[0]);
        } else {
            std::vector<std::thread> threads;
            threads.reserve(assignment.size());
            std::vector<std::vector<size_t> const *> unstarted;
            try {
                for (auto const &mine : assignment) {
                    try {
                        threads.push_back(launch([&worker, &mine]() { worker(mine); }));
                    } catch(std::system_error const &exp) {
                        log_warning("RUN", "Cannot start a worker thread (%s), "
                            "its %ld tiles run in the main thread",
                            exp.what(), (long)mine.size());
                        unstarted.push_back(&mine);
                    }
                }
                for (auto const *mine : unstarted) worker(*mine);
            } catch(...) {
                // Started threads must be joined before they go out of scope
                for (auto &thread : threads) thread.join();
                throw;
            }
            for (auto &thread : threads) thread.join();
        }

        std::sort(outcome.failed_tiles.begin(), outcome.failed_tiles.end());
        return outcome;
    }

protected:
    /** Starts a worker thread */
    virtual std::thread launch(std::function<void()> const &body) const
        { return std::thread(body); }
};

}
