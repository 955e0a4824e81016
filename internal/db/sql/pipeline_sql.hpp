#pragma once

#include <string>
#include <vector>

#include "internal/db/api/aggregation.hpp"
#include "internal/db/sql/sql_params.hpp"

namespace chessdb::db::sql {

/*
  Compiles an aggregation pipeline to one SELECT statement.

  Each stage wraps the previous one as a subquery; a leading match is
  applied directly to the base table so its indexes are used. Delta
  becomes a LAG() window, group a GROUP BY, having a WHERE over the
  grouped subquery, sort/limit ORDER BY/LIMIT.

  Population stddev is returned as a variance expression; callers take
  the square root of the columns named in sqrt_columns.
*/

struct CompiledQuery {
  std::string              sql;
  Params                   params;
  std::vector<std::string> sqrt_columns;
};

CompiledQuery CompilePipeline(const agg::Pipeline& pipeline);

} // namespace chessdb::db::sql
