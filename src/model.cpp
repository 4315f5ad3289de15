///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"


///////////////////////////
///       NAMING        ///
///////////////////////////
std::string toString(Seniority s) {
    switch (s) {
        case Seniority::JUNIOR:    return "JUNIOR";
        case Seniority::MID:       return "MID";
        case Seniority::SENIOR:    return "SENIOR";
        case Seniority::EXECUTIVE: return "EXECUTIVE";
    }
    return "UNKNOWN";
}

std::string toString(GuestType t) {
    switch (t) {
        case GuestType::BUYER:    return "BUYER";
        case GuestType::SELLER:   return "SELLER";
        case GuestType::NEUTRAL:  return "NEUTRAL";
        case GuestType::CATALYST: return "CATALYST";
    }
    return "UNKNOWN";
}

std::string toString(ConstraintType t) {
    switch (t) {
        case ConstraintType::MUST_SIT_TOGETHER:     return "MUST_SIT_TOGETHER";
        case ConstraintType::MUST_NOT_SIT_TOGETHER: return "MUST_NOT_SIT_TOGETHER";
        case ConstraintType::MAX_SELLERS_PER_TABLE: return "MAX_SELLERS_PER_TABLE";
        case ConstraintType::MIN_BUYERS_PER_TABLE:  return "MIN_BUYERS_PER_TABLE";
    }
    return "UNKNOWN";
}

std::string toString(Objective o) {
    switch (o) {
        case Objective::NOVELTY:     return "novelty";
        case Objective::DIVERSITY:   return "diversity";
        case Objective::BALANCE:     return "balance";
        case Objective::TRANSACTION: return "transaction";
    }
    return "unknown";
}

std::string toString(Impact i) {
    switch (i) {
        case Impact::POSITIVE: return "positive";
        case Impact::NEGATIVE: return "negative";
        case Impact::NEUTRAL:  return "neutral";
    }
    return "unknown";
}

std::string toString(OptimizerState s) {
    switch (s) {
        case OptimizerState::INITIALIZING:            return "initializing";
        case OptimizerState::SEARCHING:               return "searching";
        case OptimizerState::CONVERGED:               return "converged";
        case OptimizerState::ITERATION_LIMIT_REACHED: return "iteration-limit-reached";
        case OptimizerState::INFEASIBLE_TERMINATED:   return "infeasible-terminated";
    }
    return "unknown";
}

std::string tableLabel(int index) {
    return "table_" + std::to_string(index + 1);
}
