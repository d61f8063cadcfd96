#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/migrator.hpp"
#include "internal/db/api/connection.hpp"
#include "internal/registry/migration_registry.hpp"

namespace schemaflow::factory {

/*
  BuildMigrator

  Constructs the whole migrator from runtime config: connection,
  capability overrides, unit loading and graph validation.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
std::unique_ptr<core::Migrator> BuildMigrator(const schemaflow::runtime::config::RuntimeConfig& config);

// Throws util::ConfigError for a backend not compiled in,
// util::OperationError when the store cannot be opened.
std::unique_ptr<db::Connection> BuildConnection(const schemaflow::runtime::config::RuntimeConfig& config);

// Unit files of migrations.directory, validated.
registry::RegisteredGraph LoadGraph(const schemaflow::runtime::config::RuntimeConfig& config);

} // namespace schemaflow::factory
