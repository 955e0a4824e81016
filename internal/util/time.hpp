#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <google/protobuf/duration.pb.h>

namespace chessdb::util {

/*
  Time utilities. All wall-clock reads go through Now().
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

int64_t ToUnixMillis(TimePoint tp);
int64_t NowMillis();

std::chrono::milliseconds FromProto(const google::protobuf::Duration& d);

// Days since 1970-01-01 for a proleptic Gregorian date.
int64_t DaysFromCivil(int year, unsigned month, unsigned day);

bool IsValidCivilDate(int year, unsigned month, unsigned day);

// epoch ms -> "YYYY-MM-DD HH:MM:SS" (UTC)
std::string FormatUtc(int64_t unix_ms);

} // namespace chessdb::util
