#pragma once

namespace parkterm
{

// Outcome of fallible operations. Ok is the only success value.
enum class Err
{
    Ok = 0,
    // connection
    ConnectTimeout,
    CharacteristicNotFound,
    ConnectFailed,
    BusUnavailable,
    // send
    NotConnected,
    SendFailed,
    // state violations
    NoActiveConnection,
    SessionActive,
    NoSession,
    InvalidPrice,
    InvalidTicket,
    WrongState,
    // discovery
    ScanFailed,
};

inline const char *err_name(Err e)
{
    switch (e)
    {
        case Err::Ok:
            return "ok";
        case Err::ConnectTimeout:
            return "connect timeout";
        case Err::CharacteristicNotFound:
            return "UART characteristic not found";
        case Err::ConnectFailed:
            return "connect failed";
        case Err::BusUnavailable:
            return "system bus unavailable";
        case Err::NotConnected:
            return "link not connected";
        case Err::SendFailed:
            return "send failed";
        case Err::NoActiveConnection:
            return "no active connection";
        case Err::SessionActive:
            return "a session is already active";
        case Err::NoSession:
            return "no active session";
        case Err::InvalidPrice:
            return "invalid price";
        case Err::InvalidTicket:
            return "invalid ticket payload";
        case Err::WrongState:
            return "not allowed in the current session state";
        case Err::ScanFailed:
            return "scan failed";
    }
    return "?";
}

inline bool is_connection_error(Err e)
{
    return e == Err::ConnectTimeout || e == Err::CharacteristicNotFound ||
           e == Err::ConnectFailed || e == Err::BusUnavailable;
}

inline bool is_send_error(Err e)
{
    return e == Err::NotConnected || e == Err::SendFailed;
}

inline bool is_state_violation(Err e)
{
    return e == Err::NoActiveConnection || e == Err::SessionActive || e == Err::NoSession ||
           e == Err::InvalidPrice || e == Err::InvalidTicket || e == Err::WrongState;
}

}  // namespace parkterm
