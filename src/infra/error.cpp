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

#include "proddb/infra/error.hpp"

namespace proddb::infra {

const char* to_string(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::VALIDATION:
        return "VALIDATION";
    case ErrorKind::CONFLICT:
        return "CONFLICT";
    case ErrorKind::NOT_FOUND:
        return "NOT_FOUND";
    case ErrorKind::STORAGE:
        return "STORAGE";
    case ErrorKind::INTERNAL:
        return "INTERNAL";
    }
    return "INTERNAL";
}

} // namespace proddb::infra
