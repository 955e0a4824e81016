#include "internal/db/api/aggregation.hpp"

#include <set>
#include <utility>

#include "internal/util/errors.hpp"

namespace chessdb::db::agg {

namespace {

bool IsIdentifier(const std::string& name) {
  if (name.empty()) return false;
  for (std::size_t i = 0; i < name.size(); ++i) {
    const char c = name[i];
    const bool alpha = (c >= 'a' && c <= 'z') || c == '_';
    const bool digit = c >= '0' && c <= '9';
    if (!(alpha || (i > 0 && digit))) return false;
  }
  return true;
}

void RequireField(const std::set<std::string>& available, const std::string& field, const char* stage) {
  if (!IsIdentifier(field)) {
    throw util::InvalidArgument(std::string(stage) + ": invalid identifier '" + field + "'");
  }
  if (!available.contains(field)) {
    throw util::InvalidArgument(std::string(stage) + ": unknown field '" + field + "'");
  }
}

void RequireNewName(std::set<std::string>& available, const std::string& name, const char* stage) {
  if (!IsIdentifier(name)) {
    throw util::InvalidArgument(std::string(stage) + ": invalid output name '" + name + "'");
  }
  if (!available.insert(name).second) {
    throw util::InvalidArgument(std::string(stage) + ": duplicate output name '" + name + "'");
  }
}

int TypeRank(const Value& v) {
  if (std::holds_alternative<std::monostate>(v)) return 0;
  if (std::holds_alternative<std::string>(v)) return 2;
  return 1;
}

double AsNumber(const Value& v) {
  if (const auto* i = std::get_if<int64_t>(&v)) return static_cast<double>(*i);
  return std::get<double>(v);
}

} // namespace

const char* CollectionName(Collection collection) {
  switch (collection) {
    case Collection::kGames:
      return "games";
    case Collection::kRatingHistory:
      return "rating_history";
  }
  return "unknown";
}

const std::vector<std::string>& CollectionFields(Collection collection) {
  static const std::vector<std::string> kGameFields = {"white_player_id", "black_player_id", "white_rating", "black_rating", "result",
                                                       "date_ms",         "eco_code",        "opening_name", "time_control", "ply_count"};
  static const std::vector<std::string> kRatingFields = {"player_id", "timestamp_ms", "rating", "seq", "time_control"};
  return collection == Collection::kGames ? kGameFields : kRatingFields;
}

void ValidatePipeline(const Pipeline& pipeline) {
  const auto&           fields = CollectionFields(pipeline.collection);
  std::set<std::string> available(fields.begin(), fields.end());
  bool                  grouped = false;

  for (const auto& stage : pipeline.stages) {
    if (const auto* match = std::get_if<MatchStage>(&stage)) {
      for (const auto& p : match->predicates) RequireField(available, p.field, "match");
    } else if (const auto* delta = std::get_if<DeltaStage>(&stage)) {
      if (grouped) throw util::InvalidArgument("delta: must precede group");
      RequireField(available, delta->field, "delta");
      RequireField(available, delta->partition_by, "delta");
      if (delta->order_by.empty()) throw util::InvalidArgument("delta: order_by is required");
      for (const auto& f : delta->order_by) RequireField(available, f, "delta");
      RequireNewName(available, delta->as, "delta");
    } else if (const auto* group = std::get_if<GroupStage>(&stage)) {
      if (grouped) throw util::InvalidArgument("group: only one group stage is supported");
      std::set<std::string> out;
      for (const auto& k : group->keys) {
        RequireField(available, k, "group");
        RequireNewName(out, k, "group");
      }
      for (const auto& acc : group->accumulators) {
        if (!acc.field.empty()) RequireField(available, acc.field, "group");
        if (acc.field.empty() && acc.op != AccumulatorOp::kCount) {
          throw util::InvalidArgument("group: accumulator '" + acc.as + "' requires a field");
        }
        RequireNewName(out, acc.as, "group");
      }
      available = std::move(out);
      grouped   = true;
    } else if (const auto* having = std::get_if<HavingStage>(&stage)) {
      if (!grouped) throw util::InvalidArgument("having: requires a preceding group");
      for (const auto& p : having->predicates) RequireField(available, p.field, "having");
    } else if (const auto* sort = std::get_if<SortStage>(&stage)) {
      for (const auto& k : sort->keys) RequireField(available, k.field, "sort");
    }
  }
}

bool IsNull(const Value& value) {
  return std::holds_alternative<std::monostate>(value);
}

int CompareValues(const Value& a, const Value& b) {
  const int ra = TypeRank(a);
  const int rb = TypeRank(b);
  if (ra != rb) return ra < rb ? -1 : 1;
  if (ra == 0) return 0;
  if (ra == 2) {
    const int c = std::get<std::string>(a).compare(std::get<std::string>(b));
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
  }
  if (std::holds_alternative<int64_t>(a) && std::holds_alternative<int64_t>(b)) {
    const auto x = std::get<int64_t>(a);
    const auto y = std::get<int64_t>(b);
    return x < y ? -1 : (x > y ? 1 : 0);
  }
  const double x = AsNumber(a);
  const double y = AsNumber(b);
  return x < y ? -1 : (x > y ? 1 : 0);
}

bool Matches(const Value& value, CompareOp op, const Value& operand) {
  if (IsNull(value) || IsNull(operand)) return false;
  const int c = CompareValues(value, operand);
  switch (op) {
    case CompareOp::kEq:
      return c == 0;
    case CompareOp::kNe:
      return c != 0;
    case CompareOp::kLt:
      return c < 0;
    case CompareOp::kLe:
      return c <= 0;
    case CompareOp::kGt:
      return c > 0;
    case CompareOp::kGe:
      return c >= 0;
  }
  return false;
}

int64_t GetInt(const Row& row, const std::string& field, int64_t fallback) {
  auto it = row.find(field);
  if (it == row.end()) return fallback;
  if (const auto* i = std::get_if<int64_t>(&it->second)) return *i;
  if (const auto* d = std::get_if<double>(&it->second)) return static_cast<int64_t>(*d);
  return fallback;
}

double GetDouble(const Row& row, const std::string& field, double fallback) {
  auto it = row.find(field);
  if (it == row.end()) return fallback;
  if (const auto* d = std::get_if<double>(&it->second)) return *d;
  if (const auto* i = std::get_if<int64_t>(&it->second)) return static_cast<double>(*i);
  return fallback;
}

std::optional<double> GetOptionalDouble(const Row& row, const std::string& field) {
  auto it = row.find(field);
  if (it == row.end() || IsNull(it->second) || std::holds_alternative<std::string>(it->second)) return std::nullopt;
  return GetDouble(row, field);
}

std::string GetString(const Row& row, const std::string& field) {
  auto it = row.find(field);
  if (it == row.end()) return {};
  if (const auto* s = std::get_if<std::string>(&it->second)) return *s;
  return {};
}

} // namespace chessdb::db::agg
