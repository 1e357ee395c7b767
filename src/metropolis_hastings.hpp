#ifndef METROPOLIS_HASTINGS_HPP
#define METROPOLIS_HASTINGS_HPP

#include <cmath>
#include <random>
#include "exceptions.hpp"
#include "log.hpp"
#include "sampling.hpp"

namespace BLR {

/**
 * One step of a Metropolis-Hastings sampler with a symmetric proposal.
 *
 * Random numbers are drawn in a fixed order: first the proposal, then one
 * uniform deviate for the acceptance test, which is drawn even when the
 * proposal is rejected outright. Replays with the same generator state are
 * therefore bitwise identical.
 */
struct MetropolisHastings {
  /**
   * Metropolis acceptance test on the log scale.
   *
   * Accepts iff log(u) <= proposal_score - current_score. Non-finite
   * proposal scores are rejected. Equal scores are always accepted.
   */
  static bool accept(double proposal_score, double current_score, double u) {
    if (not std::isfinite(proposal_score))
      return false;
    return std::log(u) <= proposal_score - current_score;
  }

  /**
   * Propose from current with generate(current, rng), score the proposal with
   * fnc(proposal, args...) and replace current and current_score if accepted.
   *
   * Throws Exception::CorruptedChain before drawing anything if
   * current_score is not finite.
   *
   * @return true if the proposal was accepted
   */
  template <typename T, typename Gen, typename Score, typename... Args>
  static bool step(T &current, double &current_score, RNG &rng, Gen generate,
                   Score fnc, Args &... args) {
    if (not std::isfinite(current_score))
      throw Exception::CorruptedChain(current_score);
    T proposition = generate(current, rng);
    const double proposition_score = fnc(proposition, args...);
    const double u = sample_uniform(rng);
    const bool accepted = accept(proposition_score, current_score, u);
    LOG(trace) << "score = " << proposition_score
               << " current = " << current_score << " u = " << u
               << (accepted ? " accepted" : " rejected");
    if (accepted) {
      current = std::move(proposition);
      current_score = proposition_score;
    }
    return accepted;
  }
};
}

#endif
