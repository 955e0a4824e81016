#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace chessdb::db::agg {

/*
  Backend-neutral aggregation pipeline.

  A pipeline runs over one collection and is a list of stages applied in
  order. Backends either interpret it (memory) or compile it to SQL
  (sqlite). Both must return identical rows for identical data.

  Null handling follows SQL: comparisons against null are false,
  accumulators skip nulls, and nulls sort first ascending.
*/

enum class Collection { kGames, kRatingHistory };

using Value = std::variant<std::monostate, int64_t, double, std::string>;
using Row   = std::map<std::string, Value>;

using Deadline = std::chrono::steady_clock::time_point;

enum class CompareOp { kEq, kNe, kLt, kLe, kGt, kGe };

struct Predicate {
  std::string field;
  CompareOp   op = CompareOp::kEq;
  Value       value;
};

enum class AccumulatorOp {
  kCount,     // rows, or non-null values when field is set
  kSum,
  kCountIf,   // rows where field == equals
  kAvg,
  kMin,
  kMax,
  kStdDevPop, // population standard deviation
};

struct Accumulator {
  std::string   as;
  AccumulatorOp op = AccumulatorOp::kCount;
  std::string   field;
  Value         equals;
};

// conjunction of predicates, before aggregation
struct MatchStage {
  std::vector<Predicate> predicates;
};

// as = field - previous(field) within partition, ordered by order_by
struct DeltaStage {
  std::string              field;
  std::string              partition_by;
  std::vector<std::string> order_by;
  std::string              as;
};

struct GroupStage {
  std::vector<std::string> keys;
  std::vector<Accumulator> accumulators;
};

// conjunction of predicates over grouped rows
struct HavingStage {
  std::vector<Predicate> predicates;
};

struct SortKey {
  std::string field;
  bool        descending = false;
};

struct SortStage {
  std::vector<SortKey> keys;
};

struct LimitStage {
  uint64_t count = 0;
};

using Stage = std::variant<MatchStage, DeltaStage, GroupStage, HavingStage, SortStage, LimitStage>;

struct Pipeline {
  Collection         collection = Collection::kGames;
  std::vector<Stage> stages;
};

const char* CollectionName(Collection collection);

// Stored fields of a collection, in column order.
const std::vector<std::string>& CollectionFields(Collection collection);

/*
  Throws util::InvalidArgument when a stage references a field that is
  not available at that point, or an identifier is not a plain
  [a-z_][a-z0-9_]* name.
*/
void ValidatePipeline(const Pipeline& pipeline);

// Three-way comparison with SQL-like ordering: null < numbers < text.
int  CompareValues(const Value& a, const Value& b);
bool IsNull(const Value& value);
bool Matches(const Value& value, CompareOp op, const Value& operand);

// Row accessors; missing or null fields read as the fallback.
int64_t     GetInt(const Row& row, const std::string& field, int64_t fallback = 0);
double      GetDouble(const Row& row, const std::string& field, double fallback = 0.0);
std::string GetString(const Row& row, const std::string& field);
std::optional<double> GetOptionalDouble(const Row& row, const std::string& field);

} // namespace chessdb::db::agg
