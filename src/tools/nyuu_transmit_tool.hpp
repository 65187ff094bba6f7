#pragma once

#include "tools/transmit_tool.hpp"

namespace binpost::tools {

// NNTP posting through `nyuu`, which also writes the NZB manifest.
class NyuuTransmitTool final : public ITransmitTool {
public:
  explicit NyuuTransmitTool(std::string executable = "nyuu");

  std::string Name() const override { return executable_; }
  bool Available() const override;
  bool Transmit(const TransmitRequest& request, TransmitReceipt& receipt,
                std::string& error) override;

  // With `redact_password` the password argument is replaced by "***" so the
  // command can be logged and stored in reports.
  std::string BuildCommand(const TransmitRequest& request, bool redact_password) const;

private:
  std::string executable_;
};

} // namespace binpost::tools
