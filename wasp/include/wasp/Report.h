#pragma once
#include <string>
#include "Common.h"

namespace wasp {

// Renders report text from already computed metrics. Formatting lives
// outside this library; an implementation must not touch the store.
class IReportGenerator {
 public:
  virtual ~IReportGenerator() = default;
  virtual ReportArtifacts generate(const std::string& zone, const CaseMetrics& metrics, TimeMs now_ms) = 0;
};

class NullReportGenerator final : public IReportGenerator {
 public:
  ReportArtifacts generate(const std::string&, const CaseMetrics&, TimeMs) override { return {}; }
};

} // namespace wasp
