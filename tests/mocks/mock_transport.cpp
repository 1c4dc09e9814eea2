// Mock transport implementation
// This file provides stubs needed for linking tests without libcurl

#include "mock_transport.hpp"

namespace gurgeh {
namespace transport {

// Stub for create_transport() so Agent::create() links without gurgeh_transport.
// Tests pass a MockTransport explicitly; a null result exercises the factory failure path.
std::unique_ptr<IHttpTransport> create_transport() {
    return nullptr;
}

} // namespace transport
} // namespace gurgeh
