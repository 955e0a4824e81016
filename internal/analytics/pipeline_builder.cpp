#include "internal/analytics/pipeline_builder.hpp"

#include <algorithm>
#include <utility>

#include "internal/util/errors.hpp"

namespace chessdb::analytics {

using db::agg::Accumulator;
using db::agg::AccumulatorOp;

namespace acc {

namespace {

Accumulator Make(std::string as, AccumulatorOp op, std::string field, db::agg::Value equals = {}) {
  Accumulator a;
  a.as     = std::move(as);
  a.op     = op;
  a.field  = std::move(field);
  a.equals = std::move(equals);
  return a;
}

} // namespace

Accumulator Count(std::string as) {
  return Make(std::move(as), AccumulatorOp::kCount, "");
}

Accumulator CountIf(std::string as, std::string field, db::agg::Value equals) {
  return Make(std::move(as), AccumulatorOp::kCountIf, std::move(field), std::move(equals));
}

Accumulator Sum(std::string as, std::string field) {
  return Make(std::move(as), AccumulatorOp::kSum, std::move(field));
}

Accumulator Avg(std::string as, std::string field) {
  return Make(std::move(as), AccumulatorOp::kAvg, std::move(field));
}

Accumulator Min(std::string as, std::string field) {
  return Make(std::move(as), AccumulatorOp::kMin, std::move(field));
}

Accumulator Max(std::string as, std::string field) {
  return Make(std::move(as), AccumulatorOp::kMax, std::move(field));
}

Accumulator StdDevPop(std::string as, std::string field) {
  return Make(std::move(as), AccumulatorOp::kStdDevPop, std::move(field));
}

} // namespace acc

PipelineBuilder::PipelineBuilder(db::agg::Collection collection) : collection_(collection) {}

PipelineBuilder& PipelineBuilder::Match(std::string field, db::agg::CompareOp op, db::agg::Value value) {
  match_.predicates.push_back(db::agg::Predicate{std::move(field), op, std::move(value)});
  return *this;
}

PipelineBuilder& PipelineBuilder::Delta(std::string field, std::string partition_by, std::vector<std::string> order_by, std::string as) {
  deltas_.push_back(db::agg::DeltaStage{std::move(field), std::move(partition_by), std::move(order_by), std::move(as)});
  return *this;
}

PipelineBuilder& PipelineBuilder::Group(std::vector<std::string> keys, std::vector<Accumulator> accumulators) {
  if (group_) multiple_groups_ = true;
  group_ = db::agg::GroupStage{std::move(keys), std::move(accumulators)};
  return *this;
}

PipelineBuilder& PipelineBuilder::Having(std::string field, db::agg::CompareOp op, db::agg::Value value) {
  having_.predicates.push_back(db::agg::Predicate{std::move(field), op, std::move(value)});
  return *this;
}

PipelineBuilder& PipelineBuilder::SortBy(std::string field, bool descending) {
  sort_.keys.push_back(db::agg::SortKey{std::move(field), descending});
  return *this;
}

PipelineBuilder& PipelineBuilder::Limit(uint64_t count) {
  limit_ = limit_ ? std::min(*limit_, count) : count;
  return *this;
}

db::agg::Pipeline PipelineBuilder::Build() const {
  if (multiple_groups_) {
    throw util::InvalidArgument("pipeline builder: only one group stage is supported");
  }

  db::agg::Pipeline pipeline;
  pipeline.collection = collection_;

  if (!match_.predicates.empty()) pipeline.stages.emplace_back(match_);
  for (const auto& delta : deltas_) pipeline.stages.emplace_back(delta);
  if (group_) pipeline.stages.emplace_back(*group_);
  if (!having_.predicates.empty()) pipeline.stages.emplace_back(having_);
  if (!sort_.keys.empty()) pipeline.stages.emplace_back(sort_);
  if (limit_) pipeline.stages.emplace_back(db::agg::LimitStage{*limit_});

  db::agg::ValidatePipeline(pipeline);
  return pipeline;
}

} // namespace chessdb::analytics
