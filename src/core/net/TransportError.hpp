#pragma once

namespace ft::net {

    enum class TransportError {
        NotConnected,
        Closed
    };

} // namespace ft::net
