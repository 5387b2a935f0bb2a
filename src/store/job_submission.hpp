#pragma once

#include <string>
#include <core/types.hpp>
#include "job_store.hpp"

// The submission path: the only code that creates job rows.
// Builds a pending record at version 1 and inserts it.
Result<JobRecord> submit_job(JobStore& store,
                             const std::string& model_type,
                             const std::string& parameters,
                             TimePoint now = system_now());

// Job id: "20250115T100045-120__seir__3fa9c2d1". Sortable by submission time.
std::string generate_job_id(const std::string& model_type);
