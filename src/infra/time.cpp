/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

#include "proddb/infra/time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace proddb::infra {

std::string to_iso8601_utc(std::chrono::system_clock::time_point tp)
{
    using namespace std::chrono;

    auto since_epoch = duration_cast<microseconds>(tp.time_since_epoch());
    auto secs = duration_cast<seconds>(since_epoch);
    auto micros = since_epoch - duration_cast<microseconds>(secs);
    if (micros.count() < 0) {
        secs -= seconds(1);
        micros += seconds(1);
    }

    std::time_t t = static_cast<std::time_t>(secs.count());
    std::tm utc{};
    gmtime_r(&t, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0')
       << micros.count() << "+00:00";
    return ss.str();
}

std::string now_iso8601_utc()
{
    return to_iso8601_utc(std::chrono::system_clock::now());
}

} // namespace proddb::infra
