#include "ranking.hpp"
#include "errors.hpp"

#include <stdexcept>
#include <type_traits>

namespace ghrc {

namespace {

const nlohmann::json &require_field(const Record &repo, const char *field,
                                    const std::string &context) {
  auto it = repo.find(field);
  if (it == repo.end() || it->is_null()) {
    throw DecodeError("Repository " + context + " is missing '" + field + "'");
  }
  return *it;
}

std::int64_t require_count(const Record &repo, const char *field,
                           const std::string &context) {
  const auto &value = require_field(repo, field, context);
  if (!value.is_number_integer()) {
    throw DecodeError("Repository " + context + " has non-integer '" + field +
                      "'");
  }
  auto count = value.get<std::int64_t>();
  if (count < 0) {
    throw DecodeError("Repository " + context + " has negative '" + field +
                      "'");
  }
  return count;
}

template <typename Metric, typename Project>
std::vector<RankEntry<Metric>> rank_by(const std::vector<RepoMetrics> &repos,
                                       const std::string &prefix,
                                       Project project) {
  std::vector<RankEntry<Metric>> entries;
  entries.reserve(repos.size());
  for (const auto &repo : repos) {
    entries.push_back({prefix + repo.name, project(repo)});
  }
  sort_ranked(entries);
  return entries;
}

} // namespace

const char *view_kind_name(ViewKind kind) {
  switch (kind) {
  case ViewKind::Forks:
    return "forks";
  case ViewKind::OpenIssues:
    return "open_issues";
  case ViewKind::Stars:
    return "stars";
  case ViewKind::LastUpdated:
    return "last_updated";
  }
  return "unknown";
}

std::optional<ViewKind> parse_view_kind(const std::string &name) {
  for (ViewKind kind : kAllViewKinds) {
    if (name == view_kind_name(kind)) {
      return kind;
    }
  }
  return std::nullopt;
}

RepoMetrics extract_repo_metrics(const Record &repo) {
  if (!repo.is_object()) {
    throw DecodeError("Repository record is not a JSON object");
  }
  const auto &name = require_field(repo, "name", "<unnamed>");
  if (!name.is_string() || name.get_ref<const std::string &>().empty()) {
    throw DecodeError("Repository has an invalid 'name'");
  }
  RepoMetrics metrics;
  metrics.name = name.get<std::string>();
  metrics.forks_count = require_count(repo, "forks_count", metrics.name);
  metrics.open_issues_count =
      require_count(repo, "open_issues_count", metrics.name);
  metrics.stargazers_count =
      require_count(repo, "stargazers_count", metrics.name);
  const auto &updated = require_field(repo, "updated_at", metrics.name);
  if (!updated.is_string()) {
    throw DecodeError("Repository " + metrics.name +
                      " has non-string 'updated_at'");
  }
  try {
    metrics.updated_at = parse_timestamp(updated.get<std::string>());
  } catch (const std::invalid_argument &e) {
    throw DecodeError("Repository " + metrics.name + ": " + e.what());
  }
  return metrics;
}

std::map<ViewKind, RankedList>
build_ranked_views(const std::vector<RepoMetrics> &repos,
                   const std::string &organization) {
  const std::string prefix = organization + "/";
  std::map<ViewKind, RankedList> views;
  views[ViewKind::Forks] = rank_by<std::int64_t>(
      repos, prefix, [](const RepoMetrics &r) { return r.forks_count; });
  views[ViewKind::OpenIssues] = rank_by<std::int64_t>(
      repos, prefix, [](const RepoMetrics &r) { return r.open_issues_count; });
  views[ViewKind::Stars] = rank_by<std::int64_t>(
      repos, prefix, [](const RepoMetrics &r) { return r.stargazers_count; });
  views[ViewKind::LastUpdated] = rank_by<Timestamp>(
      repos, prefix, [](const RepoMetrics &r) { return r.updated_at; });
  return views;
}

std::size_t ranked_list_size(const RankedList &list) {
  return std::visit([](const auto &entries) { return entries.size(); }, list);
}

RankedList take_bottom(const RankedList &list, std::size_t n) {
  return std::visit(
      [n](const auto &entries) -> RankedList {
        auto count = std::min(n, entries.size());
        using Vec = std::decay_t<decltype(entries)>;
        return Vec(entries.begin(),
                   entries.begin() + static_cast<std::ptrdiff_t>(count));
      },
      list);
}

nlohmann::json to_json(const RankedList &list) {
  nlohmann::json out = nlohmann::json::array();
  std::visit(
      [&out](const auto &entries) {
        for (const auto &entry : entries) {
          using Metric = std::decay_t<decltype(entry.metric)>;
          if constexpr (std::is_same_v<Metric, Timestamp>) {
            out.push_back(nlohmann::json::array(
                {entry.name, format_timestamp(entry.metric)}));
          } else {
            out.push_back(nlohmann::json::array({entry.name, entry.metric}));
          }
        }
      },
      list);
  return out;
}

} // namespace ghrc
