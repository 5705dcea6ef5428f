#pragma once
// ═══════════════════════════════════════════════════════════════════
//  schemapp/schemapp.h — Umbrella header
// ═══════════════════════════════════════════════════════════════════
//
//  #include "schemapp/schemapp.h"
//  using namespace schemapp;
//
//    • SchemaBuilder, SchemaPayload, BuilderOptions
//    • Importer, Unit
//    • Registry, ConstraintStore, OrderingEngine, Aggregator
//    • FragmentValue, deepMerge()
//    • console::info(), warn(), error(), debug()
//
// ═══════════════════════════════════════════════════════════════════

// Core
#include "json_utils.h"
#include "console.h"
#include "errors.h"
#include "fragment.h"
#include "merge.h"

// Ordering and aggregation
#include "registry.h"
#include "constraints.h"
#include "ordering.h"
#include "aggregator.h"

// Assembly
#include "options.h"
#include "builder.h"
#include "importer.h"
#include "fs.h"
