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
#include "common/Error.hpp"
#include <utility>
#include <string>
#include <ostream>

namespace mesh {

std::ostream& operator<<(std::ostream& os, const ErrorCode& code) {
    os << toString(code);
    return os;
}

std::ostream& operator<<(std::ostream& os, const Error& error) {
    os << toString(error.code) << ": " << error.what;
    if (!error.service.empty()) {
        os << " (" << error.service << ")";
    }
    return os;
}

std::string toString(const ErrorCode& code) {
    switch (code)
    {
        case ErrorCode::OK: return "OK";
        case ErrorCode::InvalidArg: return "InvalidArgument";
        case ErrorCode::CircuitOpen: return "CircuitOpen";
        case ErrorCode::Transport: return "Transport";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::Application: return "Application";
        case ErrorCode::NoStub: return "NoStub";
        case ErrorCode::NoChannel: return "NoChannel";
        case ErrorCode::AlreadyRunning: return "AlreadyRunning";
        case ErrorCode::NotRunning: return "NotRunning";
        case ErrorCode::ResolutionFailure: return "ResolutionFailure";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::Unavailable: return "Unavailable";
        case ErrorCode::Unknown: return "Unknown";
    }
    return "Unknown";
}

bool isRetriable(const ErrorCode& code) {
    switch (code) {
        case ErrorCode::Transport:
        case ErrorCode::Timeout:
        case ErrorCode::Unavailable:
            return true;
        default:
            return false;
    }
}

bool countsAsFailure(const Error& error) {
    return error.code != ErrorCode::Application && error.code != ErrorCode::OK;
}

Error::Error(const ErrorCode& c, std::string w, std::string s) : code {c}, what {std::move(w)}, service {std::move(s)} {}
Error::Error(const ErrorCode& c, std::string w) : code {c}, what {std::move(w)}, service {} {}
Error::Error(const ErrorCode& c) : code {c}, what {toString(c)}, service {} {}
namespace {

// proto3 enums are open: a newer peer may send values this build does not know.
ErrorCode fromWire(int value) {
    if ((value >= static_cast<int>(ErrorCode::OK) && value <= static_cast<int>(ErrorCode::Unavailable))
        || value == static_cast<int>(ErrorCode::Unknown)) {
        return static_cast<ErrorCode>(value);
    }
    return ErrorCode::Unknown;
}

} // namespace

Error::Error(const proto::ErrorDetails& details)
    : code {fromWire(details.code())},
      what {details.what()},
      service {details.service()} {}

} // namespace mesh
