/*  This file is part of Serbridge, a library for cycle-accurate serial protocol engines.
	Copyright (C) 2021 Michael Offel, Andreas Ley
	Copyright (C) 2026 The Serbridge developers

	Serbridge is free software; you can redistribute it and/or
	modify it under the terms of the GNU Lesser General Public
	License as published by the Free Software Foundation; either
	version 3 of the License, or (at your option) any later version.

	Serbridge is distributed in the hope that it will be useful,
	but WITHOUT ANY WARRANTY; without even the implied warranty of
	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
	Lesser General Public License for more details.

	You should have received a copy of the GNU Lesser General Public
	License along with this library; if not, write to the Free Software
	Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301  USA
*/
#pragma once

#include "../../utils/Preprocessor.h"

#include <coroutine>
#include <concepts>
#include <cstdint>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace sbr::sim {

namespace internal {

template<typename ReturnValue>
struct base_promise_type {
	ReturnValue returnValue = {};
	template<std::convertible_to<ReturnValue> From>
	void return_value(From &&from) { returnValue = std::forward<From>(from); }
};

template<>
struct base_promise_type<void> {
	void return_void() { }
};

}

/**
 * @brief Coroutine type for simulation processes (test benches, line models).
 * @details A simulation process is started by the Simulator on power on and runs until its first co_await.
 * It can then wait for ticks (@ref OnClk, @ref WaitFor) or co_await other simulation functions as sub processes.
 * Simulation processes run between ticks, never during the evaluation of components, so everything they write
 * becomes visible to components in the next evaluation phase.
 *
 * Exceptions thrown inside a simulation process propagate out of Simulator::advance().
 * @code
 * sim.addSimulationProcess([&]()->SimulationFunction<> {
 *     co_await OnClk();
 *     bridge.submit(0x55);
 * });
 * @endcode
 */
template<typename ReturnValue = void>
class SimulationFunction {
	public:
		struct promise_type : public internal::base_promise_type<ReturnValue> {
			promise_type() = default;
			promise_type(const promise_type &) = delete;
			void operator=(const promise_type &) = delete;

			SimulationFunction get_return_object() { return SimulationFunction(std::coroutine_handle<promise_type>::from_promise(*this)); }
			auto initial_suspend() { return std::suspend_always(); }
			void unhandled_exception() { throw; }

			/// Transfers control back to the simulation function that co_awaited this one (if any).
			struct FinalSuspendAwaiter {
				bool await_ready() noexcept { return false; }
				std::coroutine_handle<> await_suspend(std::coroutine_handle<promise_type> handle) noexcept {
					if (handle.promise().continuation)
						return handle.promise().continuation;
					return std::noop_coroutine();
				}
				void await_resume() noexcept { }
			};
			auto final_suspend() noexcept { return FinalSuspendAwaiter{}; }

			std::coroutine_handle<> continuation;
			std::unique_ptr<std::function<SimulationFunction<ReturnValue>()>> functorInstance;
		};
		using Handle = std::coroutine_handle<promise_type>;

		SimulationFunction() = default;
		explicit SimulationFunction(Handle handle) : m_handle(handle) { }
		~SimulationFunction() { if (m_handle) m_handle.destroy(); }

		SimulationFunction(const SimulationFunction &) = delete;
		SimulationFunction &operator=(const SimulationFunction &) = delete;

		SimulationFunction(SimulationFunction &&rhs) noexcept : m_handle(std::exchange(rhs.m_handle, {})) { }
		SimulationFunction &operator=(SimulationFunction &&rhs) noexcept {
			if (this != &rhs) {
				if (m_handle) m_handle.destroy();
				m_handle = std::exchange(rhs.m_handle, {});
			}
			return *this;
		}

		Handle getHandle() const { return m_handle; }
		bool done() const { return !m_handle || m_handle.done(); }

		/// Runs the simulation function until its first suspension.
		void start() {
			SBR_ASSERT(m_handle && !m_handle.done());
			m_handle.resume();
		}

		/**
		 * @brief Awaiter for running a simulation function as a sub process of the awaiting one.
		 * @details The awaiting simulation function resumes once the sub process returned, possibly many ticks later.
		 */
		struct Call {
			Handle called;

			bool await_ready() noexcept { return !called || called.done(); }
			std::coroutine_handle<> await_suspend(std::coroutine_handle<> caller) noexcept {
				called.promise().continuation = caller;
				return called;
			}
			ReturnValue await_resume() {
				if constexpr (!std::is_void_v<ReturnValue>)
					return std::move(called.promise().returnValue);
			}
		};

		Call operator co_await() & { return Call{ m_handle }; }
		Call operator co_await() && { return Call{ m_handle }; }
	protected:
		Handle m_handle;
};

/**
 * @brief Creates a simulation function from a functor and keeps the functor alive for the lifetime of the coroutine.
 * @details Coroutine lambdas refer to their captures through the lambda object, which must therefore outlive the coroutine frame.
 */
template<typename ReturnValue>
SimulationFunction<ReturnValue> instantiate(std::function<SimulationFunction<ReturnValue>()> functor)
{
	auto functorInstance = std::make_unique<std::function<SimulationFunction<ReturnValue>()>>(std::move(functor));
	auto simFunc = (*functorInstance)();
	simFunc.getHandle().promise().functorInstance = std::move(functorInstance);
	return simFunc;
}

/**
 * @brief co_awaiting on an OnClk continues the simulation until the next tick boundary.
 * @details The simulation process resumes after all components committed the state of the tick, so it sees the new values.
 * Repeatedly co_awaiting OnClk advances one tick at a time.
 */
class OnClk {
	public:
		bool await_ready() noexcept { return false; }
		void await_suspend(std::coroutine_handle<> handle);
		void await_resume() noexcept { }
};

/**
 * @brief co_awaiting on a WaitFor continues the simulation for the specified number of ticks.
 * @details Waiting for zero ticks resumes the process again before the components of the current tick are evaluated.
 */
class WaitFor {
	public:
		WaitFor(std::uint64_t ticks) : m_ticks(ticks) { }

		bool await_ready() noexcept { return false; }
		void await_suspend(std::coroutine_handle<> handle);
		void await_resume() noexcept { }

		std::uint64_t getDuration() const { return m_ticks; }
	protected:
		std::uint64_t m_ticks;
};

extern template class SimulationFunction<void>;
extern template class SimulationFunction<bool>;
extern template class SimulationFunction<std::uint8_t>;

}

namespace sbr {
	using SimProcess = sim::SimulationFunction<void>;
}
