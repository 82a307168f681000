// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * MeshCore a service-mesh communication layer.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#ifndef MESH_COMMON_ERROR_HPP
#define MESH_COMMON_ERROR_HPP

#include <string>
#include <ostream>
#include <proto/error.pb.h>

namespace mesh {

enum class ErrorCode {
    OK = 0,
    InvalidArg = 1,
    CircuitOpen = 2,
    Transport = 3,
    Timeout = 4,
    Application = 5,
    NoStub = 6,
    NoChannel = 7,
    AlreadyRunning = 8,
    NotRunning = 9,
    ResolutionFailure = 10,
    Cancelled = 11,
    Unavailable = 12,
    Unknown = 128
};

// Transport-level failures worth another attempt.
bool isRetriable(const ErrorCode& code);

std::ostream& operator<<(std::ostream& os, const ErrorCode& code);

std::string toString(const ErrorCode& code);

struct Error {
    ErrorCode code;
    std::string what;
    std::string service;

    Error(const ErrorCode& c, std::string w);
    Error(const ErrorCode& c, std::string w, std::string s);
    explicit Error(const ErrorCode& c);
    explicit Error(const proto::ErrorDetails& details);
};

// The callee answered, so the dependency is reachable: only non-application
// errors are recorded as breaker failures.
bool countsAsFailure(const Error& error);

std::ostream& operator<<(std::ostream& os, const Error& error);

} // namespace mesh

#endif // MESH_COMMON_ERROR_HPP
