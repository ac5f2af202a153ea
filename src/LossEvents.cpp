#include "ChapterLoss/LossEvents.h"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace ChapterLoss
{
	void LogEventHandlerFailure(std::string_view a_eventName, const std::exception& a_error)
	{
		spdlog::error("ChapterLoss: {} handler threw ({}).", a_eventName, a_error.what());
	}

	bool LossEventBus::Unsubscribe(SubscriptionId a_id)
	{
		bool removed = false;
		std::apply(
			[&](auto&... a_lists) {
				const auto eraseFrom = [&](auto& a_list) {
					const auto it = std::remove_if(a_list.begin(), a_list.end(), [&](const auto& a_entry) {
						return a_entry.first == a_id;
					});
					if (it != a_list.end()) {
						a_list.erase(it, a_list.end());
						removed = true;
					}
				};
				(eraseFrom(a_lists), ...);
			},
			_handlers);
		return removed;
	}

	void LossEventBus::Clear()
	{
		std::apply([](auto&... a_lists) { (a_lists.clear(), ...); }, _handlers);
	}
}
