#include "scvst/special_functions.hpp"

#include <boost/math/policies/policy.hpp>
#include <boost/math/special_functions/digamma.hpp>
#include <boost/math/special_functions/trigamma.hpp>

#include <cmath>

namespace scvst {

namespace {
namespace policies = boost::math::policies;

// Domain and pole errors come back as NaN so they propagate through the
// likelihood sums instead of unwinding the caller.
using QuietNanPolicy = policies::policy<policies::domain_error<policies::ignore_error>,
                                        policies::pole_error<policies::ignore_error>,
                                        policies::overflow_error<policies::ignore_error>,
                                        policies::evaluation_error<policies::ignore_error>>;
}  // namespace

double digamma(double x) {
    if (std::isnan(x)) {
        return x;
    }
    return boost::math::digamma(x, QuietNanPolicy());
}

double trigamma(double x) {
    if (std::isnan(x)) {
        return x;
    }
    return boost::math::trigamma(x, QuietNanPolicy());
}

Eigen::ArrayXd digamma(const Eigen::ArrayXd& x) {
    return x.unaryExpr([](double v) { return digamma(v); });
}

Eigen::ArrayXd trigamma(const Eigen::ArrayXd& x) {
    return x.unaryExpr([](double v) { return trigamma(v); });
}

}  // namespace scvst
