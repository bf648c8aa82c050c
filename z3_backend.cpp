#include "z3_backend.h"

#include "errors.h"
#include "logger.h"

#include <z3++.h>

#include <chrono>
#include <limits>
#include <utility>
#include <vector>

namespace {

using Clock = std::chrono::steady_clock;

unsigned remainingMs(const SolveLimits& limits, Clock::time_point started) {
    double elapsed = std::chrono::duration<double>(Clock::now() - started).count();
    return z3TimeoutMs(limits.timeLimitSeconds, elapsed);
}

z3::expr weightedSum(
    z3::context& ctx,
    const z3::expr_vector& vars,
    const std::vector<LinearTerm>& terms
) {
    z3::expr_vector parts(ctx);
    for (const LinearTerm& t : terms) {
        parts.push_back(z3::ite(vars[t.var], ctx.int_val(t.coeff), ctx.int_val(0)));
    }
    if (parts.empty()) return ctx.int_val(0);
    return z3::sum(parts);
}

z3::expr toZ3(z3::context& ctx, const z3::expr_vector& vars, const LinearConstraint& c) {
    bool pseudoBoolean = !c.terms.empty();
    for (const LinearTerm& t : c.terms) {
        if (t.coeff <= 0) pseudoBoolean = false;
    }

    if (pseudoBoolean) {
        z3::expr_vector args(ctx);
        std::vector<int> coeffs;
        for (const LinearTerm& t : c.terms) {
            args.push_back(vars[t.var]);
            coeffs.push_back(t.coeff);
        }
        if (c.sense == ConstraintSense::Equal) {
            return z3::pbeq(args, coeffs.data(), c.bound);
        }
        return z3::pble(args, coeffs.data(), c.bound);
    }

    z3::expr lhs = weightedSum(ctx, vars, c.terms);
    if (c.sense == ConstraintSense::Equal) return lhs == c.bound;
    return lhs <= c.bound;
}

std::vector<bool> readAssignment(const z3::model& m, const z3::expr_vector& vars) {
    std::vector<bool> values(vars.size(), false);
    for (unsigned i = 0; i < vars.size(); ++i) {
        values[i] = m.eval(vars[i], true).is_true();
    }
    return values;
}

} // namespace

unsigned z3TimeoutMs(double limitSeconds, double elapsedSeconds) {
    if (limitSeconds <= 0) return 0;
    double left = limitSeconds - elapsedSeconds;
    if (left <= 0) return 1;

    double ms = left * 1000.0;
    if (ms >= (double)std::numeric_limits<unsigned>::max() - 1) return 0;
    return (unsigned)ms + 1;
}

std::string describeUnknown(const std::string& reason, const SolveLimits& limits) {
    if (limits.timeLimitSeconds > 0) {
        return "time limit reached (" + reason + ")";
    }
    return "solver gave up without a time limit (" + reason + ")";
}

BackendResult Z3Backend::solve(const ConstraintModel& model, const SolveLimits& limits) {
    auto started = Clock::now();

    BackendResult result;
    result.status = SolveStatus::Infeasible;
    result.hasAssignment = false;

    try {
        z3::context ctx;
        z3::expr_vector vars(ctx);
        for (const ModelVariable& v : model.variables()) {
            vars.push_back(ctx.bool_const(v.name.c_str()));
        }

        std::vector<z3::expr> hard;
        hard.reserve(model.constraints().size());
        for (const LinearConstraint& c : model.constraints()) {
            hard.push_back(toZ3(ctx, vars, c));
        }

        // 1) допустимость
        z3::solver feasibility(ctx);
        for (const z3::expr& e : hard) feasibility.add(e);

        unsigned ms = remainingMs(limits, started);
        if (ms > 0) {
            z3::params p(ctx);
            p.set("timeout", ms);
            feasibility.set(p);
        }

        z3::check_result first = feasibility.check();
        if (first == z3::unsat) {
            result.status = SolveStatus::Infeasible;
            result.detail = "unsat";
            return result;
        }
        if (first == z3::unknown) {
            result.status = SolveStatus::TimedOut;
            result.detail = describeUnknown(feasibility.reason_unknown(), limits);
            logWarning("Z3: поиск допустимого решения прерван: " + result.detail);
            return result;
        }

        result.hasAssignment = true;
        result.assignment = readAssignment(feasibility.get_model(), vars);

        if (!limits.optimize) {
            result.status = SolveStatus::Feasible;
            result.detail = "optimization disabled";
            return result;
        }
        if (!model.hasObjective()) {
            // нечего минимизировать: любое допустимое решение оптимально
            result.status = SolveStatus::Optimal;
            return result;
        }

        ms = remainingMs(limits, started);
        if (limits.timeLimitSeconds > 0 && ms == 1) {
            result.status = SolveStatus::TimedOut;
            result.detail = "no time left for optimization";
            return result;
        }

        // 2) оптимизация
        z3::optimize opt(ctx);
        for (const z3::expr& e : hard) opt.add(e);
        opt.minimize(weightedSum(ctx, vars, model.objective()));
        if (ms > 0) {
            z3::params p(ctx);
            p.set("timeout", ms);
            opt.set(p);
        }

        z3::check_result second = opt.check();
        if (second == z3::sat) {
            result.status = SolveStatus::Optimal;
            result.assignment = readAssignment(opt.get_model(), vars);
            return result;
        }
        if (second == z3::unsat) {
            // фаза 1 нашла решение, значит это сбой бэкенда
            throw SolverError("Z3 optimize reported unsat for a satisfiable model");
        }

        // unknown: оптимизатор мог успеть найти решение лучше исходного
        result.status = SolveStatus::TimedOut;
        result.detail = "optimization interrupted: " + describeUnknown(Z3_optimize_get_reason_unknown(opt.ctx(), opt), limits);
        logWarning("Z3: " + result.detail);
        try {
            std::vector<bool> improved = readAssignment(opt.get_model(), vars);
            if (model.isSatisfiedBy(improved) &&
                model.objectiveValue(improved) < model.objectiveValue(result.assignment)) {
                result.assignment = std::move(improved);
            }
        } catch (const z3::exception& e) {
            logDebug(std::string("Z3: промежуточной модели оптимизатора нет: ") + e.msg());
        }
        return result;
    } catch (const z3::exception& e) {
        throw SolverError(std::string("Z3 error: ") + e.msg());
    }
}
