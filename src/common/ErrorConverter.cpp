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
#include "common/ErrorConverter.hpp"
#include "proto/error.pb.h"
#include <google/protobuf/any.pb.h>
#include <stdexcept>
#include <grpcpp/support/status.h>
#include "common/Error.hpp"

namespace mesh {

grpc::StatusCode toGrpcStatusCode(const ErrorCode& code) {
    switch (code) {
        case ErrorCode::OK:
            return grpc::StatusCode::OK;

        case ErrorCode::InvalidArg:
            return grpc::StatusCode::INVALID_ARGUMENT;

        case ErrorCode::CircuitOpen:
        case ErrorCode::Transport:
        case ErrorCode::Unavailable:
            return grpc::StatusCode::UNAVAILABLE;

        case ErrorCode::Timeout:
            return grpc::StatusCode::DEADLINE_EXCEEDED;

        case ErrorCode::NoStub:
        case ErrorCode::NoChannel:
        case ErrorCode::ResolutionFailure:
            return grpc::StatusCode::NOT_FOUND;

        case ErrorCode::AlreadyRunning:
        case ErrorCode::NotRunning:
            return grpc::StatusCode::FAILED_PRECONDITION;

        case ErrorCode::Cancelled:
            return grpc::StatusCode::CANCELLED;

        default:
            return grpc::StatusCode::UNKNOWN;
    }
}

namespace {

ErrorCode fromStatusCode(grpc::StatusCode code) {
    switch (code) {
        case grpc::StatusCode::UNAVAILABLE:
        case grpc::StatusCode::ABORTED:
        case grpc::StatusCode::RESOURCE_EXHAUSTED:
        case grpc::StatusCode::INTERNAL:
        case grpc::StatusCode::UNKNOWN:
            return ErrorCode::Transport;
        case grpc::StatusCode::DEADLINE_EXCEEDED:
            return ErrorCode::Timeout;
        case grpc::StatusCode::CANCELLED:
            return ErrorCode::Cancelled;
        default:
            return ErrorCode::Application;
    }
}

bool describesLink(ErrorCode code) {
    switch (code) {
        case ErrorCode::Transport:
        case ErrorCode::Timeout:
        case ErrorCode::Unavailable:
        case ErrorCode::Cancelled:
        case ErrorCode::Unknown:
            return true;
        default:
            return false;
    }
}

} // namespace

std::expected<void, Error> toExpected(const grpc::Status& status) {
    if (status.ok()) {
        return {};
    }
    return std::unexpected {toError(status)};
}

grpc::Status toGrpcStatus(const Error& error) {
    proto::ErrorDetails details;
    details.set_code(static_cast<proto::ErrorCode>(error.code));
    details.set_what(error.what);
    details.set_service(error.service);
    google::protobuf::Any anyDetail;
    anyDetail.PackFrom(details);
    return grpc::Status(toGrpcStatusCode(error.code), error.what, anyDetail.SerializeAsString());
}

Error toError(const grpc::Status& status) {
    if (status.error_code() == grpc::StatusCode::OK) {
        throw std::logic_error("Cannot convert OK status to error");
    }
    const ErrorCode linkCode = fromStatusCode(status.error_code());
    proto::ErrorDetails details;
    google::protobuf::Any any;
    if (!status.error_details().empty() && any.ParseFromString(status.error_details())) {
        if (any.UnpackTo(&details)) {
            // The peer answered: its own verdict is an application error, and
            // only the status code speaks for the link.
            Error error {details};
            error.code = describesLink(error.code) ? linkCode : ErrorCode::Application;
            return error;
        }
    }
    return Error(linkCode, status.error_message());
}

} // namespace mesh
