#include "SessionTypes.hpp"

auto localmesh::session::toString(Role role) -> std::string_view {
    return role == Role::Initiator ? "initiator" : "responder";
}

auto localmesh::session::toString(ConnectionState state) -> std::string_view {
    switch (state) {
        case ConnectionState::New:
            return "new";
        case ConnectionState::Negotiating:
            return "negotiating";
        case ConnectionState::Connected:
            return "connected";
        case ConnectionState::Disconnected:
            return "disconnected";
        case ConnectionState::Failed:
            return "failed";
    }
    return "unknown";
}

auto localmesh::session::toString(SessionError error) -> std::string_view {
    switch (error) {
        case SessionError::InvalidTransition:
            return "operation not allowed in the current session state";
        case SessionError::MalformedDescriptor:
            return "descriptor is malformed";
        case SessionError::NegotiationFailed:
            return "could not generate the local descriptor";
        case SessionError::ApplyFailed:
            return "remote descriptor was rejected";
        case SessionError::GatheringTimedOut:
            return "candidate gathering did not complete in time";
        case SessionError::ChannelNotOpen:
            return "data channel is not open";
        case SessionError::EmptyMessage:
            return "message is empty";
        case SessionError::TransferInProgress:
            return "a file is already being sent";
        case SessionError::FileUnavailable:
            return "file cannot be read";
        case SessionError::TransportFailure:
            return "transport failure";
        case SessionError::SessionClosed:
            return "session is closed";
    }
    return "unknown session error";
}
