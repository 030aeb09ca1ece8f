//////////////////////////////////////////////////////////////////////////////////////
//
// (C) Daniel Strano and the Qrack contributors 2017-2023. All rights reserved.
//
// This is a multithreaded, sharded state vector simulation of quantum circuits,
// stepped moment by moment, with measurement collapse and parameter sweeps.
//
// Licensed under the GNU Lesser General Public License V3.
// See LICENSE.md in the project root or https://www.gnu.org/licenses/lgpl-3.0.en.html
// for details.

#include "param_resolver.hpp"

namespace Qshard {

real1_f ParamResolver::Lookup(const std::string& name) const
{
    const auto it = params.find(name);
    if (it == params.end()) {
        throw UnresolvedSymbol("ParamResolver::Lookup() no value for symbol \"" + name + "\"!");
    }

    return it->second;
}

real1_f QParam::GetValue() const
{
    if (isSymbol) {
        throw UnresolvedSymbol("QParam::GetValue() symbol \"" + symbol + "\" has not been resolved!");
    }

    return value;
}

QParam QParam::Resolve(const ParamResolver& resolver) const
{
    if (!isSymbol) {
        return *this;
    }

    return QParam(value * resolver.Lookup(symbol));
}

QSweep SweepPoints(const std::string& key, const std::vector<real1_f>& values)
{
    QSweep toRet;
    toRet.reserve(values.size());
    for (size_t i = 0U; i < values.size(); ++i) {
        std::map<std::string, real1_f> point;
        point[key] = values[i];
        toRet.push_back(ParamResolver(point));
    }

    return toRet;
}

QSweep SweepLinspace(const std::string& key, real1_f start, real1_f stop, size_t length)
{
    std::vector<real1_f> values;
    if (length == 1U) {
        values.push_back(start);
    } else if (length > 1U) {
        const real1_f step = (stop - start) / (real1_f)(length - 1U);
        for (size_t i = 0U; i < length; ++i) {
            values.push_back(start + step * (real1_f)i);
        }
    }

    return SweepPoints(key, values);
}

QSweep SweepProduct(const QSweep& left, const QSweep& right)
{
    QSweep toRet;
    for (const ParamResolver& l : left) {
        for (const ParamResolver& r : right) {
            std::map<std::string, real1_f> merged = l.GetParams();
            for (const auto& p : r.GetParams()) {
                if (merged.find(p.first) != merged.end()) {
                    throw std::invalid_argument("SweepProduct() symbol \"" + p.first + "\" is swept twice!");
                }
                merged[p.first] = p.second;
            }
            toRet.push_back(ParamResolver(merged));
        }
    }

    return toRet;
}

} // namespace Qshard
