#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/gqlpp.h — Umbrella header for gqlpp
// ═══════════════════════════════════════════════════════════════════
//
//  #include "gqlpp/gqlpp.h"
//  using namespace gqlpp;
//
//  This single include gives you everything:
//    • gqlpp::promiseToExecute(), executeSync()
//    • promise::SyncAdapter, Future, Promise, Deferred, defer()
//    • type::Schema, ObjectType, TypeRef
//    • language::parse(), validator::validate()
//    • executor::execute()
//    • console::log(), error(), warn(), info(), debug()
//
// ═══════════════════════════════════════════════════════════════════

// Core
#include "value.h"
#include "console.h"
#include "error.h"

// Futures
#include "task_queue.h"
#include "future.h"
#include "thenable.h"
#include "sync_adapter.h"

// Language & types
#include "ast.h"
#include "parser.h"
#include "schema.h"
#include "validator.h"

// Execution
#include "execution_result.h"
#include "executor.h"
#include "graphql.h"
