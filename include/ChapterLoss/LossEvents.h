#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

#include "ChapterLoss/LossError.h"
#include "ChapterLoss/LossTypes.h"
#include "ChapterLoss/PersistenceGateway.h"

namespace ChapterLoss
{
	struct ChapterInitializedEvent
	{
		static constexpr std::string_view kName = "chapter_initialized";

		std::string chapterId{};
		std::uint32_t unitCount{ 0 };
		std::uint32_t playerUnits{ 0 };
		std::uint32_t enemyUnits{ 0 };
	};

	struct CharacterLossProcessedEvent
	{
		static constexpr std::string_view kName = "character_loss_processed";

		Unit unit{};
		LossCause cause{};
		LostCharacter lostCharacter{};
		std::uint32_t totalLosses{ 0 };
	};

	struct CharacterLossErrorEvent
	{
		static constexpr std::string_view kName = "character_loss_error";

		Unit unit{};
		LossCause cause{};
		LossErrorDetails error{};
	};

	struct DangerLevelChangedEvent
	{
		static constexpr std::string_view kName = "danger_level_changed";

		Unit unit{};
		DangerLevel oldLevel{ DangerLevel::kNone };
		DangerLevel newLevel{ DangerLevel::kNone };
	};

	struct AllCharactersLostEvent
	{
		static constexpr std::string_view kName = "all_characters_lost";

		std::string chapterId{};
		std::uint32_t totalLosses{ 0 };
		std::vector<LostCharacter> lostCharacters{};
		std::string reason{};
	};

	struct GameOverEvent
	{
		static constexpr std::string_view kName = "game_over";

		std::string reason{};
		std::string chapterId{};
		std::uint32_t totalLosses{ 0 };
		ChapterLossSummary finalState{};
	};

	struct ChapterCompletedEvent
	{
		static constexpr std::string_view kName = "chapter_completed";

		std::string chapterId{};
		ChapterLossSummary summary{};
		std::int64_t completedAt{ 0 };
	};

	struct ChapterSuspendedEvent
	{
		static constexpr std::string_view kName = "chapter_suspended";

		std::string chapterId{};
		std::int64_t suspendedAt{ 0 };
		std::uint32_t totalLosses{ 0 };
	};

	struct ChapterResumedEvent
	{
		static constexpr std::string_view kName = "chapter_resumed";

		std::string chapterId{};
		std::int64_t resumedAt{ 0 };
		std::uint32_t totalLosses{ 0 };
		std::vector<LostCharacter> lostCharacters{};
	};

	struct PerformanceWarningEvent
	{
		static constexpr std::string_view kName = "performance_warning";

		std::string type{};
		double processingTimeMs{ 0.0 };
		double thresholdMs{ 0.0 };
		std::string unitId{};
		LossCauseType causeType{ LossCauseType::kBattleDefeat };
	};

	struct ChapterDataRecoveredEvent
	{
		static constexpr std::string_view kName = "chapter_data_recovered";

		std::string chapterId{};
		LoadSource source{ LoadSource::kPrimary };
		std::string message{};
	};

	using SubscriptionId = std::uint64_t;

	void LogEventHandlerFailure(std::string_view a_eventName, const std::exception& a_error);

	// Synchronous typed publish/subscribe. Handlers run in subscription order on the publishing
	// thread; a throwing handler is logged and does not stop the others.
	class LossEventBus
	{
	public:
		template <class E>
		using Handler = std::function<void(const E&)>;

		template <class E>
		SubscriptionId Subscribe(Handler<E> a_handler)
		{
			const SubscriptionId id = _nextId++;
			Handlers<E>().emplace_back(id, std::move(a_handler));
			return id;
		}

		bool Unsubscribe(SubscriptionId a_id);
		void Clear();

		template <class E>
		void Publish(const E& a_event) const
		{
			// Copy so handlers may subscribe or unsubscribe while we dispatch.
			const auto handlers = Handlers<E>();
			for (const auto& [id, handler] : handlers) {
				if (!handler) {
					continue;
				}
				try {
					handler(a_event);
				} catch (const std::exception& e) {
					LogEventHandlerFailure(E::kName, e);
				}
			}
		}

		template <class E>
		[[nodiscard]] std::size_t SubscriberCount() const
		{
			return Handlers<E>().size();
		}

	private:
		template <class E>
		using HandlerList = std::vector<std::pair<SubscriptionId, Handler<E>>>;

		template <class E>
		HandlerList<E>& Handlers()
		{
			return std::get<HandlerList<E>>(_handlers);
		}

		template <class E>
		const HandlerList<E>& Handlers() const
		{
			return std::get<HandlerList<E>>(_handlers);
		}

		std::tuple<
			HandlerList<ChapterInitializedEvent>,
			HandlerList<CharacterLossProcessedEvent>,
			HandlerList<CharacterLossErrorEvent>,
			HandlerList<DangerLevelChangedEvent>,
			HandlerList<AllCharactersLostEvent>,
			HandlerList<GameOverEvent>,
			HandlerList<ChapterCompletedEvent>,
			HandlerList<ChapterSuspendedEvent>,
			HandlerList<ChapterResumedEvent>,
			HandlerList<PerformanceWarningEvent>,
			HandlerList<ChapterDataRecoveredEvent>>
			_handlers{};
		SubscriptionId _nextId{ 1 };
	};
}
