#ifndef GROUP_BY_HPP
#define GROUP_BY_HPP

#include "analytics/Records.hpp"
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/sum.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/count.hpp>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace prodintel {

enum class ReducerKind {
    Sum,
    Mean,
    Count,
    UniqueSorted
};

/**
 * @brief One named reduction applied to every group
 *
 * Sum and Mean read a numeric field through @c value. A field that yields
 * std::nullopt for any record of a group makes that group's result undefined
 * instead of being skipped. UniqueSorted collects the distinct identifiers
 * returned by @c category in ascending order.
 */
template <typename Record>
struct Reducer {
    std::string name;
    ReducerKind kind = ReducerKind::Count;
    std::function<std::optional<double>(const Record&)> value;
    std::function<Identifier(const Record&)> category;

    static Reducer sum(std::string name, std::function<std::optional<double>(const Record&)> value) {
        return Reducer{std::move(name), ReducerKind::Sum, std::move(value), nullptr};
    }

    static Reducer mean(std::string name, std::function<std::optional<double>(const Record&)> value) {
        return Reducer{std::move(name), ReducerKind::Mean, std::move(value), nullptr};
    }

    static Reducer count(std::string name) {
        return Reducer{std::move(name), ReducerKind::Count, nullptr, nullptr};
    }

    static Reducer uniqueSorted(std::string name, std::function<Identifier(const Record&)> category) {
        return Reducer{std::move(name), ReducerKind::UniqueSorted, nullptr, std::move(category)};
    }
};

/**
 * @brief Reduced values of one group
 */
struct GroupAggregates {
    std::map<std::string, std::optional<double>> values;
    std::map<std::string, std::vector<Identifier>> unique_values;
    std::size_t record_count = 0;

    /// Result of a Sum/Mean/Count reducer; std::nullopt when undefined
    std::optional<double> metric(const std::string& name) const {
        auto it = values.find(name);
        if (it == values.end()) {
            throw std::out_of_range("GroupAggregates: no reducer named '" + name + "'");
        }
        return it->second;
    }

    /// Result of a reducer whose inputs are always defined (sums of counters, counts)
    double value(const std::string& name) const {
        return metric(name).value();
    }

    const std::vector<Identifier>& unique(const std::string& name) const {
        auto it = unique_values.find(name);
        if (it == unique_values.end()) {
            throw std::out_of_range("GroupAggregates: no unique reducer named '" + name + "'");
        }
        return it->second;
    }
};

namespace detail {

namespace ba = boost::accumulators;

using ReducerAccumulator = ba::accumulator_set<double,
    ba::stats<
        ba::tag::sum,
        ba::tag::mean,
        ba::tag::count
    >
>;

template <typename Record>
struct GroupState {
    std::vector<ReducerAccumulator> accumulators;
    std::vector<bool> undefined;
    std::vector<std::set<Identifier>> categories;
    std::size_t record_count = 0;

    explicit GroupState(std::size_t num_reducers)
        : accumulators(num_reducers),
          undefined(num_reducers, false),
          categories(num_reducers) {}
};

} // namespace detail

/**
 * @brief Group records by a key and apply every reducer to each group
 * @param records Input collection (not modified)
 * @param key_fn Callable mapping a record to its group key
 * @param reducers Reductions to apply per group
 * @return Groups ordered ascending by key
 */
template <typename Key, typename Record, typename KeyFn>
std::map<Key, GroupAggregates> groupBy(
    const std::vector<Record>& records,
    KeyFn key_fn,
    const std::vector<Reducer<Record>>& reducers) {

    namespace ba = boost::accumulators;

    std::map<Key, detail::GroupState<Record>> states;

    for (const auto& record : records) {
        auto it = states.find(key_fn(record));
        if (it == states.end()) {
            it = states.emplace(key_fn(record), detail::GroupState<Record>(reducers.size())).first;
        }
        auto& state = it->second;
        ++state.record_count;

        for (std::size_t r = 0; r < reducers.size(); ++r) {
            const auto& reducer = reducers[r];
            switch (reducer.kind) {
                case ReducerKind::Sum:
                case ReducerKind::Mean: {
                    const std::optional<double> v = reducer.value(record);
                    if (v) {
                        state.accumulators[r](*v);
                    } else {
                        state.undefined[r] = true;
                    }
                    break;
                }
                case ReducerKind::Count:
                    state.accumulators[r](1.0);
                    break;
                case ReducerKind::UniqueSorted:
                    state.categories[r].insert(reducer.category(record));
                    break;
            }
        }
    }

    std::map<Key, GroupAggregates> result;
    for (auto& [key, state] : states) {
        GroupAggregates aggregates;
        aggregates.record_count = state.record_count;

        for (std::size_t r = 0; r < reducers.size(); ++r) {
            const auto& reducer = reducers[r];
            const auto& acc = state.accumulators[r];
            switch (reducer.kind) {
                case ReducerKind::Sum:
                    aggregates.values[reducer.name] = state.undefined[r]
                        ? std::nullopt
                        : std::optional<double>(ba::sum(acc));
                    break;
                case ReducerKind::Mean:
                    aggregates.values[reducer.name] = (state.undefined[r] || ba::count(acc) == 0)
                        ? std::nullopt
                        : std::optional<double>(ba::mean(acc));
                    break;
                case ReducerKind::Count:
                    aggregates.values[reducer.name] = static_cast<double>(ba::count(acc));
                    break;
                case ReducerKind::UniqueSorted:
                    aggregates.unique_values[reducer.name].assign(
                        state.categories[r].begin(), state.categories[r].end());
                    break;
            }
        }
        result.emplace(key, std::move(aggregates));
    }

    return result;
}

} // namespace prodintel

#endif // GROUP_BY_HPP
