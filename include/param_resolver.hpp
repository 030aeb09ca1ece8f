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

#pragma once

#include "common/qshard_errors.hpp"
#include "common/qshard_types.hpp"

#include <map>
#include <string>
#include <vector>

namespace Qshard {

/**
 * Immutable assignment of real values to symbol names.
 */
class ParamResolver {
protected:
    std::map<std::string, real1_f> params;

public:
    ParamResolver() {}
    ParamResolver(const std::map<std::string, real1_f>& p)
        : params(p)
    {
        // Intentionally left blank.
    }

    /// Value bound to "name," or UnresolvedSymbol
    real1_f Lookup(const std::string& name) const;
    bool Contains(const std::string& name) const { return params.find(name) != params.end(); }
    const std::map<std::string, real1_f>& GetParams() const { return params; }
    bool operator==(const ParamResolver& other) const { return params == other.params; }
};

/**
 * A gate parameter: either a fixed real number, or a real coefficient times a named symbol.
 */
class QParam {
protected:
    bool isSymbol;
    real1_f value;
    std::string symbol;

public:
    QParam(real1_f v = ZERO_R1_F)
        : isSymbol(false)
        , value(v)
        , symbol()
    {
        // Intentionally left blank.
    }
    QParam(const std::string& s, real1_f coefficient = ONE_R1_F)
        : isSymbol(true)
        , value(coefficient)
        , symbol(s)
    {
        // Intentionally left blank.
    }
    QParam(const char* s)
        : isSymbol(true)
        , value(ONE_R1_F)
        , symbol(s)
    {
        // Intentionally left blank.
    }

    bool IsSymbol() const { return isSymbol; }
    const std::string& GetSymbol() const { return symbol; }
    /// Coefficient of the symbol, for a symbolic parameter
    real1_f GetCoefficient() const { return value; }
    /// Numeric value; throws UnresolvedSymbol if still symbolic.
    real1_f GetValue() const;
    /// Substitute the symbol from "resolver." Numeric parameters are returned unchanged.
    QParam Resolve(const ParamResolver& resolver) const;

    QParam operator*(real1_f scale) const
    {
        QParam toRet(*this);
        toRet.value *= scale;
        return toRet;
    }
};

typedef std::vector<ParamResolver> QSweep;

/// One resolver per listed value of "key"
QSweep SweepPoints(const std::string& key, const std::vector<real1_f>& values);
/// "length" evenly spaced values of "key" from "start" to "stop", inclusive
QSweep SweepLinspace(const std::string& key, real1_f start, real1_f stop, size_t length);
/// Cartesian product, with the right-hand sweep varying fastest
QSweep SweepProduct(const QSweep& left, const QSweep& right);

} // namespace Qshard
