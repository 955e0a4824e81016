#include "internal/db/sql/pipeline_sql.hpp"

#include <sstream>

namespace chessdb::db::sql {

namespace {

const char* OpSql(agg::CompareOp op) {
  switch (op) {
    case agg::CompareOp::kEq:
      return "=";
    case agg::CompareOp::kNe:
      return "<>";
    case agg::CompareOp::kLt:
      return "<";
    case agg::CompareOp::kLe:
      return "<=";
    case agg::CompareOp::kGt:
      return ">";
    case agg::CompareOp::kGe:
      return ">=";
  }
  return "=";
}

Param ToParam(const agg::Value& value) {
  if (const auto* i = std::get_if<int64_t>(&value)) return *i;
  if (const auto* d = std::get_if<double>(&value)) return *d;
  if (const auto* s = std::get_if<std::string>(&value)) return *s;
  return nullptr;
}

std::string WhereClause(const std::vector<agg::Predicate>& predicates, Params& params) {
  if (predicates.empty()) return {};
  std::ostringstream out;
  out << " WHERE ";
  for (std::size_t i = 0; i < predicates.size(); ++i) {
    if (i > 0) out << " AND ";
    out << predicates[i].field << ' ' << OpSql(predicates[i].op) << " ?";
    params.push_back(ToParam(predicates[i].value));
  }
  return out.str();
}

std::string Join(const std::vector<std::string>& items) {
  std::string out;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i > 0) out += ",";
    out += items[i];
  }
  return out;
}

std::string AccumulatorSql(const agg::Accumulator& acc, Params& params, std::vector<std::string>& sqrt_columns) {
  const auto& f = acc.field;
  switch (acc.op) {
    case agg::AccumulatorOp::kCount:
      return f.empty() ? "COUNT(*)" : "COUNT(" + f + ")";
    case agg::AccumulatorOp::kCountIf:
      params.push_back(ToParam(acc.equals));
      return "COALESCE(SUM(CASE WHEN " + f + " = ? THEN 1 ELSE 0 END),0)";
    case agg::AccumulatorOp::kSum:
      return "SUM(" + f + ")";
    case agg::AccumulatorOp::kAvg:
      return "AVG(" + f + ")";
    case agg::AccumulatorOp::kMin:
      return "MIN(" + f + ")";
    case agg::AccumulatorOp::kMax:
      return "MAX(" + f + ")";
    case agg::AccumulatorOp::kStdDevPop:
      sqrt_columns.push_back(acc.as);
      return "(AVG(" + f + "*" + f + ")-AVG(" + f + ")*AVG(" + f + "))";
  }
  return "NULL";
}

} // namespace

CompiledQuery CompilePipeline(const agg::Pipeline& pipeline) {
  agg::ValidatePipeline(pipeline);

  CompiledQuery out;
  int           alias = 0;

  const auto&  fields = agg::CollectionFields(pipeline.collection);
  std::string  current = "SELECT " + Join(fields) + " FROM " + agg::CollectionName(pipeline.collection);
  Params       current_params;
  bool         sorted = false;
  std::size_t  first  = 0;

  if (!pipeline.stages.empty()) {
    if (const auto* match = std::get_if<agg::MatchStage>(&pipeline.stages.front())) {
      current += WhereClause(match->predicates, current_params);
      first = 1;
    }
  }

  auto wrap = [&](const std::string& select, Params select_params, const std::string& tail, const Params& tail_params) {
    current = "SELECT " + select + " FROM (" + current + ") AS s" + std::to_string(alias++) + tail;
    select_params.insert(select_params.end(), current_params.begin(), current_params.end());
    select_params.insert(select_params.end(), tail_params.begin(), tail_params.end());
    current_params = std::move(select_params);
    sorted         = false;
  };

  for (std::size_t i = first; i < pipeline.stages.size(); ++i) {
    const auto& stage = pipeline.stages[i];

    if (const auto* match = std::get_if<agg::MatchStage>(&stage)) {
      Params      tail_params;
      const auto  where = WhereClause(match->predicates, tail_params);
      wrap("*", {}, where, tail_params);
    } else if (const auto* delta = std::get_if<agg::DeltaStage>(&stage)) {
      const std::string expr = "*, (" + delta->field + " - LAG(" + delta->field + ") OVER (PARTITION BY " + delta->partition_by +
                               " ORDER BY " + Join(delta->order_by) + ")) AS " + delta->as;
      wrap(expr, {}, "", {});
    } else if (const auto* group = std::get_if<agg::GroupStage>(&stage)) {
      std::vector<std::string> select = group->keys;
      Params                   select_params;
      for (const auto& acc : group->accumulators) {
        select.push_back(AccumulatorSql(acc, select_params, out.sqrt_columns) + " AS " + acc.as);
      }
      const std::string tail = group->keys.empty() ? "" : " GROUP BY " + Join(group->keys);
      wrap(Join(select), std::move(select_params), tail, {});
    } else if (const auto* having = std::get_if<agg::HavingStage>(&stage)) {
      Params      tail_params;
      const auto  where = WhereClause(having->predicates, tail_params);
      wrap("*", {}, where, tail_params);
    } else if (const auto* sort = std::get_if<agg::SortStage>(&stage)) {
      std::vector<std::string> keys;
      for (const auto& k : sort->keys) keys.push_back(k.field + (k.descending ? " DESC" : " ASC"));
      wrap("*", {}, keys.empty() ? "" : " ORDER BY " + Join(keys), {});
      sorted = true;
    } else if (const auto* limit = std::get_if<agg::LimitStage>(&stage)) {
      if (sorted) {
        // same level as ORDER BY keeps the ordering defined
        current += " LIMIT ?";
        current_params.push_back(static_cast<int64_t>(limit->count));
        sorted = false;
      } else {
        wrap("*", {}, " LIMIT ?", {Param{static_cast<int64_t>(limit->count)}});
      }
    }
  }

  out.sql    = current + ";";
  out.params = std::move(current_params);
  return out;
}

} // namespace chessdb::db::sql
