#pragma once

#include <string>
#include <variant>
#include <vector>
#include <cstdint>

namespace chessdb::db::sql {

/*
  Parameter abstraction.

  SQLite: ? ? ?  (ordered binding)
*/

using Param = std::variant<
    std::nullptr_t,
    int32_t,
    int64_t,
    uint64_t,
    double,
    std::string
>;

using Params = std::vector<Param>;

}
