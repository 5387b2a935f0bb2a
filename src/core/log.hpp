#pragma once

#include <string>
#include <filesystem>

// Process-wide log file. Defaults to <temp>/simcoord.log until configured.
void set_log_path(const std::filesystem::path& path);
std::filesystem::path log_path();

// Persistent per-job audit log: <log dir>/jobs/{job_id}.log
std::filesystem::path job_log_path(const std::string& job_id);

// Append a timestamped line to the process log.
void coord_log(const std::string& msg);

// Loud anomaly channel: logged with an ALERT marker and echoed to stderr.
// Used when two actors believed they owned the same job.
void coord_alert(const std::string& msg);

// Append a timestamped line to a job's audit log.
void append_job_log(const std::string& job_id, const std::string& msg);
