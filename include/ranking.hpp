/**
 * @file ranking.hpp
 * @brief Ranked "bottom" views over the cached repositories.
 */
#ifndef GITHUBREADCACHE_RANKING_HPP
#define GITHUBREADCACHE_RANKING_HPP

#include "upstream_client.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ghrc {

/// The four fixed rankings.
enum class ViewKind { Forks, OpenIssues, Stars, LastUpdated };

/// Every view kind, in a stable order.
constexpr std::array<ViewKind, 4> kAllViewKinds = {
    ViewKind::Forks, ViewKind::OpenIssues, ViewKind::Stars,
    ViewKind::LastUpdated};

/// Wire name of a view kind (`forks`, `open_issues`, `stars`, `last_updated`).
const char *view_kind_name(ViewKind kind);

/// Inverse of view_kind_name(); empty for unknown names.
std::optional<ViewKind> parse_view_kind(const std::string &name);

/**
 * One ranked repository. The metric type is fixed per view so sorting never
 * inspects a dynamic value.
 */
template <typename Metric> struct RankEntry {
  std::string name;
  Metric metric{};
};

using CountEntry = RankEntry<std::int64_t>;
using TimestampEntry = RankEntry<Timestamp>;

/// Ascending ranking; the alternative is determined by the view kind.
using RankedList =
    std::variant<std::vector<CountEntry>, std::vector<TimestampEntry>>;

/// Ranking-relevant fields of a repository record.
struct RepoMetrics {
  std::string name;
  std::int64_t forks_count{0};
  std::int64_t open_issues_count{0};
  std::int64_t stargazers_count{0};
  Timestamp updated_at{};
};

/**
 * Extract the ranking fields of a repository.
 *
 * @throws DecodeError When a field is missing, has the wrong type, holds a
 *         negative count or an unparseable timestamp.
 */
RepoMetrics extract_repo_metrics(const Record &repo);

/**
 * Sort entries ascending by metric, breaking ties by name ascending.
 */
template <typename Metric>
void sort_ranked(std::vector<RankEntry<Metric>> &entries) {
  std::sort(entries.begin(), entries.end(),
            [](const RankEntry<Metric> &a, const RankEntry<Metric> &b) {
              if (a.metric != b.metric) {
                return a.metric < b.metric;
              }
              return a.name < b.name;
            });
}

/**
 * Build all four views. Entry names are `<organization>/<repo name>`.
 *
 * @param repos Extracted repository metrics.
 * @param organization Organization prefix for entry names.
 * @return One ascending list per view kind, each as long as @p repos.
 */
std::map<ViewKind, RankedList>
build_ranked_views(const std::vector<RepoMetrics> &repos,
                   const std::string &organization);

/// Number of entries in @p list.
std::size_t ranked_list_size(const RankedList &list);

/**
 * The first `min(n, size)` entries of @p list, order preserved.
 */
RankedList take_bottom(const RankedList &list, std::size_t n);

/// `[[name, metric], ...]`; timestamps rendered by format_timestamp().
nlohmann::json to_json(const RankedList &list);

} // namespace ghrc

#endif // GITHUBREADCACHE_RANKING_HPP
