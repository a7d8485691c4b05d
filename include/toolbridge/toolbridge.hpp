#ifndef TOOLBRIDGE_HPP
#define TOOLBRIDGE_HPP

// Main header that includes everything

#include <toolbridge/client.hpp>
#include <toolbridge/errors.hpp>
#include <toolbridge/protocol/jsonrpc.hpp>
#include <toolbridge/transport.hpp>
#include <toolbridge/types.hpp>
#include <toolbridge/version.hpp>

// Schema-driven tool layer on top of ProtocolClient
#include <toolbridge/tools/argument_extractor.hpp>
#include <toolbridge/tools/handler.hpp>
#include <toolbridge/tools/registry.hpp>
#include <toolbridge/tools/schema.hpp>

#endif // TOOLBRIDGE_HPP
