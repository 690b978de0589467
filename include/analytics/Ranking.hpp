#ifndef RANKING_HPP
#define RANKING_HPP

#include <algorithm>
#include <cstddef>
#include <optional>
#include <vector>

namespace prodintel {

/**
 * @brief Clamp a requested rank count to [1, total]
 * @return 0 only when the collection is empty
 */
inline std::size_t clampRankCount(long long n, std::size_t total) {
    if (total == 0) return 0;
    if (n < 1) return 1;
    if (static_cast<unsigned long long>(n) > total) return total;
    return static_cast<std::size_t>(n);
}

/**
 * @brief Sort rows descending by a metric
 *
 * Undefined metrics (std::nullopt) rank below every defined value. Rows with
 * equal metrics are ordered by key ascending, so top-N and bottom-N drawn from
 * the result never overlap or skip rows.
 */
template <typename Row, typename MetricFn, typename KeyFn>
void sortByMetricDescending(std::vector<Row>& rows, MetricFn metric, KeyFn key) {
    std::stable_sort(rows.begin(), rows.end(), [&](const Row& a, const Row& b) {
        const std::optional<double> ma = metric(a);
        const std::optional<double> mb = metric(b);
        if (ma.has_value() != mb.has_value()) {
            return ma.has_value();
        }
        if (ma && *ma != *mb) {
            return *ma > *mb;
        }
        return key(a) < key(b);
    });
}

/**
 * @brief First n rows of a descending-sorted collection, n clamped to [1, size]
 */
template <typename Row>
std::vector<Row> topN(const std::vector<Row>& sorted_desc, long long n) {
    const std::size_t count = clampRankCount(n, sorted_desc.size());
    return std::vector<Row>(sorted_desc.begin(), sorted_desc.begin() + static_cast<std::ptrdiff_t>(count));
}

/**
 * @brief Last n rows of a descending-sorted collection, lowest first
 *
 * Equivalent to the first n rows of the ascending order, so for n == size the
 * result is topN reversed.
 */
template <typename Row>
std::vector<Row> bottomN(const std::vector<Row>& sorted_desc, long long n) {
    const std::size_t count = clampRankCount(n, sorted_desc.size());
    return std::vector<Row>(sorted_desc.rbegin(), sorted_desc.rbegin() + static_cast<std::ptrdiff_t>(count));
}

} // namespace prodintel

#endif // RANKING_HPP
