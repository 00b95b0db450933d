#pragma once

#include "gapfill/audit/audit_log.hpp"
#include "gapfill/store/sqlite_database.hpp"

#include <memory>

namespace gapfill::audit {

class SqliteAuditLog final : public AuditLog {
public:
	explicit SqliteAuditLog(std::shared_ptr<store::Database> db);

	std::int64_t appendTraining(const TrainingLogEntry &entry) override;
	std::int64_t appendValidation(const ValidationLogEntry &entry) override;
	std::int64_t appendImputation(const ImputationLogEntry &entry) override;
	std::int64_t replaceImputation(const ImputationLogEntry &entry, const std::string &reason) override;
	bool supersedeImputation(const std::string &station_id, core::TimePoint timestamp, core::Parameter parameter,
	                         const std::string &reason) override;
	std::optional<ImputationLogEntry> activeImputation(const std::string &station_id, core::TimePoint timestamp,
	                                                   core::Parameter parameter) const override;
	std::vector<ImputationLogEntry> imputations(const std::string &station_id, core::Parameter parameter,
	                                            core::TimePoint start, core::TimePoint end) const override;
	std::vector<TrainingLogEntry> trainingHistory(const std::string &station_id,
	                                              core::Parameter parameter) const override;
	std::vector<ValidationLogEntry> validationHistory(const std::string &station_id,
	                                                  core::Parameter parameter) const override;

private:
	std::int64_t insertImputation(const ImputationLogEntry &entry);
	bool markSuperseded(const std::string &station_id, core::TimePoint timestamp, core::Parameter parameter,
	                    const std::string &reason);

	std::shared_ptr<store::Database> db_;
};

} // namespace gapfill::audit
