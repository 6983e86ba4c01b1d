#ifndef SKYVAULT_TRANSFER_STAGE_CHAIN_H_
#define SKYVAULT_TRANSFER_STAGE_CHAIN_H_

#include <string>
#include <vector>

#include "lineage/snapshot.h"
#include "stage.h"

namespace Skyvault {

struct ToolSet {
	std::string serializer = "btrfs";
	std::string encryptor = "age";
	std::string meter = "pv";
};

/**
 * Fixed-arity builder of the stage chain for one unit:
 *
 *   serializer -> [encryptor] -> [meter]
 *
 * Build() returns the spawn specs in order; stage N's stdout feeds stage N+1's
 * stdin and the last one writes the artifact.
 */
class StageChainBuilder {
public:
	StageChainBuilder(const ToolSet& tools, const ArchivalUnit& unit);

	StageChainBuilder& WithEncryption(bool enabled, const std::string& recipient);
	StageChainBuilder& WithMetering(bool enabled, const std::string& rate_limit);

	std::vector<CommandSpec> Build() const;

	bool encrypting() const { return encrypt_; }
	bool metering() const { return meter_; }

private:
	ToolSet tools_;
	ArchivalUnit unit_;
	bool encrypt_ = false;
	std::string recipient_;
	bool meter_ = false;
	std::string rate_limit_;
};

// Stage labels, also used in diagnostics.
inline constexpr char kSerializerLabel[] = "serializer";
inline constexpr char kEncryptorLabel[] = "encryptor";
inline constexpr char kMeterLabel[] = "meter";

} // namespace Skyvault

#endif // SKYVAULT_TRANSFER_STAGE_CHAIN_H_
