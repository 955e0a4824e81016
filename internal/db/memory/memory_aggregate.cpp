#include "memory_aggregate.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>

#include "internal/util/errors.hpp"

namespace chessdb::db::memory {

namespace {

using agg::Value;

class DeadlineGuard {
 public:
  explicit DeadlineGuard(std::optional<agg::Deadline> deadline) : deadline_(deadline) {
    Check();
  }

  void Tick() {
    if (++ticks_ % kDeadlineCheckInterval == 0) Check();
  }

  void Check() const {
    if (deadline_ && std::chrono::steady_clock::now() >= *deadline_) {
      throw util::QueryTimeout("aggregation exceeded its time budget");
    }
  }

 private:
  std::optional<agg::Deadline> deadline_;
  std::size_t                  ticks_ = 0;
};

Value GameField(const model::GameRow& g, const std::string& field) {
  if (field == "white_player_id") return g.white_player_id;
  if (field == "black_player_id") return g.black_player_id;
  if (field == "white_rating") return static_cast<int64_t>(g.white_rating);
  if (field == "black_rating") return static_cast<int64_t>(g.black_rating);
  if (field == "result") return static_cast<int64_t>(g.result);
  if (field == "date_ms") return g.date_ms;
  if (field == "eco_code") return g.eco_code;
  if (field == "opening_name") return g.opening_name;
  if (field == "time_control") return static_cast<int64_t>(g.time_control);
  if (field == "ply_count") return static_cast<int64_t>(g.ply_count);
  return std::monostate{};
}

Value RatingField(const model::RatingPointRecord& p, const std::string& field) {
  if (field == "player_id") return p.player_id;
  if (field == "timestamp_ms") return p.timestamp_ms;
  if (field == "rating") return static_cast<int64_t>(p.rating);
  if (field == "seq") return static_cast<int64_t>(p.seq);
  if (field == "time_control") return static_cast<int64_t>(p.time_control);
  return std::monostate{};
}

template <typename Record, typename Accessor>
bool MatchesAll(const Record& record, const std::vector<agg::Predicate>& predicates, Accessor field) {
  for (const auto& p : predicates) {
    if (!agg::Matches(field(record, p.field), p.op, p.value)) return false;
  }
  return true;
}

bool MatchesAll(const agg::Row& row, const std::vector<agg::Predicate>& predicates) {
  for (const auto& p : predicates) {
    auto it = row.find(p.field);
    if (it == row.end() || !agg::Matches(it->second, p.op, p.value)) return false;
  }
  return true;
}

// Index positions for the first equality predicate on an indexed field.
const std::vector<std::size_t>* IndexLookup(const MemoryState& state, agg::Collection collection, const agg::MatchStage& match) {
  static const std::vector<std::size_t> kEmpty;

  for (const auto& p : match.predicates) {
    if (p.op != agg::CompareOp::kEq) continue;

    if (collection == agg::Collection::kRatingHistory) {
      if (p.field != "player_id") continue;
      const auto* key = std::get_if<std::string>(&p.value);
      if (!key) return &kEmpty;
      auto it = state.points_by_player.find(*key);
      return it == state.points_by_player.end() ? &kEmpty : &it->second;
    }

    const std::unordered_map<std::string, std::vector<std::size_t>>* index = nullptr;
    if (p.field == "eco_code") index = &state.games_by_eco;
    if (p.field == "white_player_id") index = &state.games_by_white;
    if (p.field == "black_player_id") index = &state.games_by_black;
    if (index) {
      const auto* key = std::get_if<std::string>(&p.value);
      if (!key) return &kEmpty;
      auto it = index->find(*key);
      return it == index->end() ? &kEmpty : &it->second;
    }
    if (p.field == "time_control") {
      const auto* key = std::get_if<int64_t>(&p.value);
      if (!key) continue;
      auto it = state.games_by_time_control.find(*key);
      return it == state.games_by_time_control.end() ? &kEmpty : &it->second;
    }
  }
  return nullptr;
}

template <typename Record, typename Accessor>
std::vector<agg::Row> Scan(const std::vector<Record>& records, agg::Collection collection, const std::vector<std::size_t>* candidates,
                           const agg::MatchStage* leading, Accessor field, DeadlineGuard& guard) {
  const auto&           fields = agg::CollectionFields(collection);
  std::vector<agg::Row> rows;

  auto visit = [&](const Record& record) {
    guard.Tick();
    if (leading && !MatchesAll(record, leading->predicates, field)) return;
    agg::Row row;
    for (const auto& f : fields) row.emplace(f, field(record, f));
    rows.push_back(std::move(row));
  };

  if (candidates) {
    for (auto pos : *candidates) visit(records[pos]);
  } else {
    for (const auto& record : records) visit(record);
  }
  return rows;
}

struct ValueVectorLess {
  bool operator()(const std::vector<Value>& a, const std::vector<Value>& b) const {
    for (std::size_t i = 0; i < a.size() && i < b.size(); ++i) {
      const int c = agg::CompareValues(a[i], b[i]);
      if (c != 0) return c < 0;
    }
    return a.size() < b.size();
  }
};

struct AccState {
  int64_t rows       = 0;
  int64_t count_if   = 0;
  int64_t non_null   = 0;
  bool    all_int    = true;
  int64_t int_sum    = 0;
  double  double_sum = 0.0;
  double  sum_sq     = 0.0;
  Value   min;
  Value   max;
};

void Accumulate(AccState& st, const agg::Accumulator& acc, const agg::Row& row) {
  ++st.rows;
  if (acc.field.empty()) return;

  auto        it = row.find(acc.field);
  const Value v  = it == row.end() ? Value{} : it->second;

  if (acc.op == agg::AccumulatorOp::kCountIf) {
    if (agg::Matches(v, agg::CompareOp::kEq, acc.equals)) ++st.count_if;
    return;
  }
  if (agg::IsNull(v)) return;

  ++st.non_null;
  if (agg::IsNull(st.min) || agg::CompareValues(v, st.min) < 0) st.min = v;
  if (agg::IsNull(st.max) || agg::CompareValues(v, st.max) > 0) st.max = v;

  if (const auto* i = std::get_if<int64_t>(&v)) {
    st.int_sum += *i;
    st.double_sum += static_cast<double>(*i);
    st.sum_sq += static_cast<double>(*i) * static_cast<double>(*i);
  } else if (const auto* d = std::get_if<double>(&v)) {
    st.all_int = false;
    st.double_sum += *d;
    st.sum_sq += *d * *d;
  }
}

Value Finish(const AccState& st, const agg::Accumulator& acc) {
  switch (acc.op) {
    case agg::AccumulatorOp::kCount:
      return acc.field.empty() ? st.rows : st.non_null;
    case agg::AccumulatorOp::kCountIf:
      return st.count_if;
    case agg::AccumulatorOp::kSum:
      if (st.non_null == 0) return std::monostate{};
      if (st.all_int) return st.int_sum;
      return st.double_sum;
    case agg::AccumulatorOp::kAvg:
      if (st.non_null == 0) return std::monostate{};
      return st.double_sum / static_cast<double>(st.non_null);
    case agg::AccumulatorOp::kMin:
      return st.min;
    case agg::AccumulatorOp::kMax:
      return st.max;
    case agg::AccumulatorOp::kStdDevPop: {
      if (st.non_null == 0) return std::monostate{};
      const double n        = static_cast<double>(st.non_null);
      const double mean     = st.double_sum / n;
      const double variance = st.sum_sq / n - mean * mean;
      return std::sqrt(std::max(0.0, variance));
    }
  }
  return std::monostate{};
}

void ApplyMatch(std::vector<agg::Row>& rows, const std::vector<agg::Predicate>& predicates, DeadlineGuard& guard) {
  std::vector<agg::Row> kept;
  kept.reserve(rows.size());
  for (auto& row : rows) {
    guard.Tick();
    if (MatchesAll(row, predicates)) kept.push_back(std::move(row));
  }
  rows = std::move(kept);
}

void ApplyDelta(std::vector<agg::Row>& rows, const agg::DeltaStage& delta, DeadlineGuard& guard) {
  std::vector<std::size_t> order(rows.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
    const int pc = agg::CompareValues(rows[a].at(delta.partition_by), rows[b].at(delta.partition_by));
    if (pc != 0) return pc < 0;
    for (const auto& f : delta.order_by) {
      const int c = agg::CompareValues(rows[a].at(f), rows[b].at(f));
      if (c != 0) return c < 0;
    }
    return false;
  });

  std::vector<agg::Row> out;
  out.reserve(rows.size());
  const agg::Row* prev = nullptr;
  for (auto idx : order) {
    guard.Tick();
    agg::Row row = std::move(rows[idx]);
    Value    result;
    if (prev && agg::CompareValues(prev->at(delta.partition_by), row.at(delta.partition_by)) == 0) {
      const auto& cur  = row.at(delta.field);
      const auto& last = prev->at(delta.field);
      if (!agg::IsNull(cur) && !agg::IsNull(last)) {
        if (std::holds_alternative<int64_t>(cur) && std::holds_alternative<int64_t>(last)) {
          result = std::get<int64_t>(cur) - std::get<int64_t>(last);
        } else if (!std::holds_alternative<std::string>(cur) && !std::holds_alternative<std::string>(last)) {
          const double c = std::holds_alternative<double>(cur) ? std::get<double>(cur) : static_cast<double>(std::get<int64_t>(cur));
          const double l = std::holds_alternative<double>(last) ? std::get<double>(last) : static_cast<double>(std::get<int64_t>(last));
          result = c - l;
        }
      }
    }
    row[delta.as] = result;
    out.push_back(std::move(row));
    prev = &out.back();
  }
  rows = std::move(out);
}

void ApplyGroup(std::vector<agg::Row>& rows, const agg::GroupStage& group, DeadlineGuard& guard) {
  std::map<std::vector<Value>, std::vector<AccState>, ValueVectorLess> groups;

  for (const auto& row : rows) {
    guard.Tick();
    std::vector<Value> key;
    key.reserve(group.keys.size());
    for (const auto& k : group.keys) key.push_back(row.at(k));

    auto& states = groups[key];
    states.resize(group.accumulators.size());
    for (std::size_t i = 0; i < group.accumulators.size(); ++i) Accumulate(states[i], group.accumulators[i], row);
  }

  // ungrouped aggregate yields one row even over no input
  if (group.keys.empty() && groups.empty()) {
    groups[{}].resize(group.accumulators.size());
  }

  std::vector<agg::Row> out;
  out.reserve(groups.size());
  for (const auto& [key, states] : groups) {
    agg::Row row;
    for (std::size_t i = 0; i < group.keys.size(); ++i) row.emplace(group.keys[i], key[i]);
    for (std::size_t i = 0; i < group.accumulators.size(); ++i) row.emplace(group.accumulators[i].as, Finish(states[i], group.accumulators[i]));
    out.push_back(std::move(row));
  }
  rows = std::move(out);
}

void ApplySort(std::vector<agg::Row>& rows, const agg::SortStage& sort) {
  std::stable_sort(rows.begin(), rows.end(), [&](const agg::Row& a, const agg::Row& b) {
    for (const auto& k : sort.keys) {
      const int c = agg::CompareValues(a.at(k.field), b.at(k.field));
      if (c != 0) return k.descending ? c > 0 : c < 0;
    }
    return false;
  });
}

} // namespace

std::vector<agg::Row> RunPipeline(const MemoryState& state, const agg::Pipeline& pipeline, std::optional<agg::Deadline> deadline) {
  agg::ValidatePipeline(pipeline);
  DeadlineGuard guard(deadline);

  std::size_t            first   = 0;
  const agg::MatchStage* leading = nullptr;
  if (!pipeline.stages.empty()) {
    leading = std::get_if<agg::MatchStage>(&pipeline.stages.front());
    if (leading) first = 1;
  }

  const std::vector<std::size_t>* candidates = leading ? IndexLookup(state, pipeline.collection, *leading) : nullptr;

  std::vector<agg::Row> rows;
  if (pipeline.collection == agg::Collection::kGames) {
    rows = Scan(state.games, pipeline.collection, candidates, leading, GameField, guard);
  } else {
    rows = Scan(state.rating_points, pipeline.collection, candidates, leading, RatingField, guard);
  }

  for (std::size_t i = first; i < pipeline.stages.size(); ++i) {
    const auto& stage = pipeline.stages[i];
    if (const auto* match = std::get_if<agg::MatchStage>(&stage)) {
      ApplyMatch(rows, match->predicates, guard);
    } else if (const auto* delta = std::get_if<agg::DeltaStage>(&stage)) {
      ApplyDelta(rows, *delta, guard);
    } else if (const auto* group = std::get_if<agg::GroupStage>(&stage)) {
      ApplyGroup(rows, *group, guard);
    } else if (const auto* having = std::get_if<agg::HavingStage>(&stage)) {
      ApplyMatch(rows, having->predicates, guard);
    } else if (const auto* sort = std::get_if<agg::SortStage>(&stage)) {
      ApplySort(rows, *sort);
    } else if (const auto* limit = std::get_if<agg::LimitStage>(&stage)) {
      if (rows.size() > limit->count) rows.resize(limit->count);
    }
    guard.Check();
  }

  return rows;
}

} // namespace chessdb::db::memory
