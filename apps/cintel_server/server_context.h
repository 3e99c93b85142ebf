#pragma once

#include "cintel/core/clock.h"
#include "cintel/core/id_generator.h"
#include "cintel/core/services.h"
#include "cintel/ingest/document_ingestor.h"

#include "config.h"
#include <ostream>

namespace cintel::server {

// ServerContext holds all process-lifetime service references passed to every tool handler.
// All references must remain valid for the lifetime of run_server_loop().
struct ServerContext {
  core::Services& services;          // NOLINT(readability-identifier-naming)
  ingest::IDocumentIngestor& ingestor;  // NOLINT(readability-identifier-naming)
  core::IIdGenerator& id_gen;        // NOLINT(readability-identifier-naming)
  core::IClock& clock;               // NOLINT(readability-identifier-naming)
  const ServerConfig& config;        // NOLINT(readability-identifier-naming)
  // JSON-RPC frames, one per line. Streaming tools write notifications here before the
  // response to their request.
  std::ostream& out;                 // NOLINT(readability-identifier-naming)
};

}  // namespace cintel::server
