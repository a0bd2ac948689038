/// @file   LockData.hpp
/// @brief  Declarative locking of the data a listener needs
///
/// A lock bundle is a plain struct listing the data a reaction needs, each
/// entry tagged read or write:
/// @code
/// struct HelloWorldData {
///     event::Read<HelloWorldObject> hello_world;
///     event::Write<Output> output;
///
///     EMBER_CAPABILITIES(hello_world, output)
/// };
///
/// auto hello_world = MakeShared<HelloWorldObject>("Hello, world!");
/// auto output = MakeShared<Output>();
/// auto data = MakeShared<HelloWorldData>(hello_world, output);
///
/// EventHandler<HelloWorldEvent> handler;
/// event::Listen(data, handler, [](const HelloWorldEvent&, const HelloWorldObject& in, Output& out) {
///     out.message = in.message;
/// });
/// @endcode
///
/// Every time the event fires the listener upgrades and try-locks the entries
/// in the order given to EMBER_CAPABILITIES, and only runs the reaction once it
/// holds all of them. The lock/unlock logic lives in Acquire(), nobody has to
/// write it per listener.

#pragma once

#include <Ember/Event/EventHandler.hpp>
#include <Ember/Event/ListenError.hpp>
#include <Ember/Event/Shared.hpp>
#include <concepts>
#include <expected>
#include <functional>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>

/// @def EMBER_CAPABILITIES(...)
/// Declares which fields of a lock bundle are locked, and in which order.
/// The reaction receives them in that same order.
#define EMBER_CAPABILITIES(...)                         \
	[[nodiscard]]                                       \
	auto capabilities() const noexcept {                \
		return std::tie(__VA_ARGS__);                     \
	}

namespace ember::event {

/// @brief Read-only access to a shared value
template<typename T>
struct Read {
	using value_type = T;
	using guard_type = ReadGuard<T>;
	using reference = const T&;

	Weak<T> ref;

	Read() = default;

	Read(const Strong<T>& strong) : ref(strong) { }

	Read(Weak<T> weak) : ref(std::move(weak)) { }

	/// @brief Upgrades the reference and tries to read-lock it
	[[nodiscard]]
	std::expected<guard_type, ListenError> TryAcquire() const {
		Strong<T> strong = ref.lock();
		if (!strong) {
			return std::unexpected(ListenError::RequirementDeleted);
		}
		auto guard = strong->TryRead();
		if (!guard) {
			return std::unexpected(ListenError::LockUnavailable);
		}
		return std::move(*guard);
	}
};

/// @brief Read-write access to a shared value
template<typename T>
struct Write {
	using value_type = T;
	using guard_type = WriteGuard<T>;
	using reference = T&;

	Weak<T> ref;

	Write() = default;

	Write(const Strong<T>& strong) : ref(strong) { }

	Write(Weak<T> weak) : ref(std::move(weak)) { }

	/// @brief Upgrades the reference and tries to write-lock it
	[[nodiscard]]
	std::expected<guard_type, ListenError> TryAcquire() const {
		Strong<T> strong = ref.lock();
		if (!strong) {
			return std::unexpected(ListenError::RequirementDeleted);
		}
		auto guard = strong->TryWrite();
		if (!guard) {
			return std::unexpected(ListenError::LockUnavailable);
		}
		return std::move(*guard);
	}
};

template<typename C>
concept Capability = requires(const C& c) {
	typename C::guard_type;
	typename C::reference;
	{ c.TryAcquire() } -> std::same_as<std::expected<typename C::guard_type, ListenError>>;
};

/// A struct declaring its capabilities with EMBER_CAPABILITIES
template<typename D>
concept LockBundle = requires(const D& d) { d.capabilities(); };

namespace detail {

template<typename C>
bool TryAcquireInto(const C& capability, std::optional<typename C::guard_type>& slot, ListenError& error) {
	auto guard = capability.TryAcquire();
	if (!guard) {
		error = guard.error();
		return false;
	}
	slot.emplace(std::move(*guard));
	return true;
}

template<typename... Caps, size_t... I>
auto AcquireTuple(const std::tuple<const Caps&...>& caps, std::index_sequence<I...>)
    -> std::expected<std::tuple<typename Caps::guard_type...>, ListenError> {
	std::tuple<std::optional<typename Caps::guard_type>...> slots;
	ListenError error = ListenError::LockUnavailable;

	// && short-circuits left to right, so later capabilities are never touched
	// once one fails. Whatever was acquired is released when slots goes away.
	const bool acquired = (TryAcquireInto(std::get<I>(caps), std::get<I>(slots), error) && ...);
	if (!acquired) {
		return std::unexpected(error);
	}
	return std::tuple<typename Caps::guard_type...>(std::move(*std::get<I>(slots))...);
}

template<typename D>
using CapabilityTuple = decltype(std::declval<const D&>().capabilities());

template<typename F, typename E, typename Tuple>
struct IsReaction : std::false_type { };

template<typename F, typename E, typename... Caps>
struct IsReaction<F, E, std::tuple<Caps...>>
    : std::is_invocable<F&, const E&, typename std::remove_cvref_t<Caps>::reference...> { };

}

/// @brief Acquires every capability in order, all or nothing
///
/// The first capability that can't be upgraded yields RequirementDeleted, the
/// first one that can't be locked yields LockUnavailable. In both cases the
/// remaining capabilities are not attempted and nothing stays locked.
template<Capability... Caps>
[[nodiscard]]
std::expected<std::tuple<typename Caps::guard_type...>, ListenError> Acquire(const std::tuple<const Caps&...>& caps) {
	return detail::AcquireTuple(caps, std::index_sequence_for<Caps...> {});
}

template<Capability... Caps>
[[nodiscard]]
std::expected<std::tuple<typename Caps::guard_type...>, ListenError> Acquire(const Caps&... caps) {
	return Acquire(std::tie(caps...));
}

namespace detail {

template<typename D>
Strong<D> Upgrade(const Strong<D>& data) {
	return data;
}

template<typename D>
Strong<D> Upgrade(const Weak<D>& data) {
	return data.lock();
}

/// Builds the function of a listener bound to @p data, which is either a
/// Strong<D> (the listener owns the bundle) or a Weak<D> (it doesn't)
template<LockBundle D, EventType E, typename Ref, typename F>
typename Listener<E>::Function MakeReaction(Ref data, F&& func) {
	return [data = std::move(data), func = std::forward<F>(func)](const E& e) -> ListenResult {
		// The bundle itself is the first requirement
		Strong<D> bundle = Upgrade(data);
		if (!bundle) {
			return std::unexpected(ListenError::RequirementDeleted);
		}
		auto bundle_guard = bundle->TryRead();
		if (!bundle_guard) {
			return std::unexpected(ListenError::LockUnavailable);
		}

		auto guards = Acquire(bundle_guard->get().capabilities());
		if (!guards) {
			return std::unexpected(guards.error());
		}

		std::apply(
		    [&func, &e](auto&... guard) {
			    std::invoke(func, e, guard.get()...);
		    },
		    *guards
		);
		return {};
	};
}

}

/// @brief Registers @p func on @p handler, the listener keeps @p data alive
///
/// @p func is called as func(event, field...) with one reference per declared
/// capability: const T& for Read<T>, T& for Write<T>.
template<LockBundle D, EventType E, typename F>
void Listen(const Strong<D>& data, EventHandler<E>& handler, F&& func) {
	static_assert(
	    detail::IsReaction<const std::decay_t<F>, E, std::remove_cvref_t<detail::CapabilityTuple<D>>>::value,
	    "The reaction must take the event followed by one reference per capability, in declaration order"
	);
	EMBER_ASSERT(data, "Listening with a null lock bundle");

	Listener<E> listener { handler.NewId(), detail::MakeReaction<D, E>(data, std::forward<F>(func)) };
	handler.Insert(std::move(listener));
}

/// @brief Registers @p func on @p handler without owning @p data
///
/// Once the owner of the bundle drops it, the listener is removed with the
/// next event, the same as if one of its capabilities had been deleted.
template<LockBundle D, EventType E, typename F>
void Listen(const Weak<D>& data, EventHandler<E>& handler, F&& func) {
	static_assert(
	    detail::IsReaction<const std::decay_t<F>, E, std::remove_cvref_t<detail::CapabilityTuple<D>>>::value,
	    "The reaction must take the event followed by one reference per capability, in declaration order"
	);

	Listener<E> listener { handler.NewId(), detail::MakeReaction<D, E>(data, std::forward<F>(func)) };
	handler.Insert(std::move(listener));
}

}
