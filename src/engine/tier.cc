#include "tier.h"
#include "error/error.h"

namespace tether {

void RequireTier(Tier active, Tier required, const std::string& feature) {
	if (active < required) {
		throw UnsupportedCapabilityError{
			feature + " requires capability tier " + std::to_string(required) +
			" but the active tier is " + std::to_string(active)
		};
	}
}

} // namespace tether
