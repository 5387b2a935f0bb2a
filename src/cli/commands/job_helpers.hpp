#pragma once

#include "../base_cli.hpp"
#include <store/job_record.hpp>
#include <string>
#include <vector>

// Shared helpers used by the command files (jobs.cpp, service.cpp)

std::string status_label(JobStatus status, int width = 0);
void print_job_detail(const JobRecord& job, TimePoint now);
void print_job_table(const std::vector<JobRecord>& jobs, TimePoint now);

// "a b c" from args[from..]
std::string join_args(const std::vector<std::string>& args, std::size_t from);
