#include "stage_chain.h"

#include "common/overloaded.h"

namespace Skyvault {

StageChainBuilder::StageChainBuilder(const ToolSet& tools, const ArchivalUnit& unit)
	: tools_(tools), unit_(unit) {}

StageChainBuilder& StageChainBuilder::WithEncryption(bool enabled, const std::string& recipient) {
	encrypt_ = enabled;
	recipient_ = recipient;
	return *this;
}

StageChainBuilder& StageChainBuilder::WithMetering(bool enabled, const std::string& rate_limit) {
	meter_ = enabled;
	rate_limit_ = rate_limit;
	return *this;
}

std::vector<CommandSpec> StageChainBuilder::Build() const {
	std::vector<CommandSpec> specs;

	CommandSpec send{kSerializerLabel, tools_.serializer, {"send"}};
	std::visit(Overloaded{
		[&send](const FullUnit& full) {
			send.args.push_back(full.snapshot.absolute_path);
		},
		[&send](const IncrementalUnit& inc) {
			send.args.push_back("-p");
			send.args.push_back(inc.parent.absolute_path);
			send.args.push_back(inc.snapshot.absolute_path);
		},
	}, unit_);
	specs.push_back(std::move(send));

	if (encrypt_) {
		specs.push_back(CommandSpec{kEncryptorLabel, tools_.encryptor, {"-r", recipient_}});
	}

	if (meter_) {
		// One progress line per second on stderr, forced even without a tty.
		CommandSpec meter{kMeterLabel, tools_.meter, {"-i", "1", "-f"}};
		if (!rate_limit_.empty()) {
			meter.args.push_back("-L");
			meter.args.push_back(rate_limit_);
		}
		specs.push_back(std::move(meter));
	}

	return specs;
}

} // namespace Skyvault
