#pragma once

/*
===============================================================================
Reckon - Public API Entry Point
===============================================================================

Ledger reconciliation and anomaly detection for subscription balance
transactions recovered from application logs.

Typical use:

    reckon::config::Engine cfg;                       // defaults
    reckon::Reconciler r;
    if (reckon::Reconciler::make(cfg, r) != reckon::config::Error::None) ...
    reckon::Report report;
    r.run(records, report);

The Reconciler facade, the Report it fills and the configuration types are the
public contract. The JSON Lines reader / writer in reckon::io are provided for
command-line use.
===============================================================================
*/

#include <reckon/config/engine.hpp>
#include <reckon/config/error.hpp>
#include <reckon/config/loader.hpp>
#include <reckon/reconciler.hpp>
#include <reckon/io/record_reader.hpp>
#include <reckon/io/table_writer.hpp>
#include <lcr/format.hpp>
