#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/aggregation.hpp"

namespace chessdb::analytics {

namespace acc {

db::agg::Accumulator Count(std::string as);
db::agg::Accumulator CountIf(std::string as, std::string field, db::agg::Value equals);
db::agg::Accumulator Sum(std::string as, std::string field);
db::agg::Accumulator Avg(std::string as, std::string field);
db::agg::Accumulator Min(std::string as, std::string field);
db::agg::Accumulator Max(std::string as, std::string field);
db::agg::Accumulator StdDevPop(std::string as, std::string field);

} // namespace acc

/*
  PipelineBuilder

  Stages may be declared in any order. Build() always emits:

      match -> delta -> group -> having -> sort -> limit

  so record filters reach the backend before any aggregation and can use
  its indexes. Repeated Match/Having calls are AND-ed; sort keys keep
  declaration order; the smallest limit wins.
*/
class PipelineBuilder {
 public:
  explicit PipelineBuilder(db::agg::Collection collection);

  PipelineBuilder& Match(std::string field, db::agg::CompareOp op, db::agg::Value value);
  PipelineBuilder& Delta(std::string field, std::string partition_by, std::vector<std::string> order_by, std::string as);
  PipelineBuilder& Group(std::vector<std::string> keys, std::vector<db::agg::Accumulator> accumulators);
  PipelineBuilder& Having(std::string field, db::agg::CompareOp op, db::agg::Value value);
  PipelineBuilder& SortBy(std::string field, bool descending = false);
  PipelineBuilder& Limit(uint64_t count);

  // Throws util::InvalidArgument for an invalid pipeline.
  db::agg::Pipeline Build() const;

 private:
  db::agg::Collection collection_;

  db::agg::MatchStage                match_;
  std::vector<db::agg::DeltaStage>   deltas_;
  std::optional<db::agg::GroupStage> group_;
  db::agg::HavingStage               having_;
  db::agg::SortStage                 sort_;
  std::optional<uint64_t>            limit_;
  bool                               multiple_groups_ = false;
};

} // namespace chessdb::analytics
