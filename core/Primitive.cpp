/*
 * Primitive.cpp
 *
 *  Created on: 2026-10-12
 *
 *  Immutable scalar payloads: integers, doubles, booleans and strings.
 */

#include "../headers/slot_internal.h"
#include <sstream>

namespace slot
{
    Primitive::Primitive() :
        type(PRIMITIVE_TYPE_NONE),
        integerValue(0),
        doubleValue(0.0),
        booleanValue(false)
    {
    }

    Primitive Primitive::fromInteger(long long value)
    {
        Primitive p;
        p.type = PRIMITIVE_TYPE_INTEGER;
        p.integerValue = value;
        return p;
    }

    Primitive Primitive::fromDouble(double value)
    {
        Primitive p;
        p.type = PRIMITIVE_TYPE_DOUBLE;
        p.doubleValue = value;
        return p;
    }

    Primitive Primitive::fromBoolean(bool value)
    {
        Primitive p;
        p.type = PRIMITIVE_TYPE_BOOLEAN;
        p.booleanValue = value;
        return p;
    }

    Primitive Primitive::fromString(const std::string& value)
    {
        Primitive p;
        p.type = PRIMITIVE_TYPE_STRING;
        p.stringValue = value;
        return p;
    }

    long long Primitive::asLong() const
    {
        if (!isInteger())
            throw std::runtime_error("Primitive is not an integer type.");
        return integerValue;
    }

    /**
     * @brief Numeric value as a double. Integers are widened.
     */
    double Primitive::asDouble() const
    {
        if (isDouble())
            return doubleValue;
        if (isInteger())
            return static_cast<double>(integerValue);
        throw std::runtime_error("Primitive is not a numeric type.");
    }

    bool Primitive::asBoolean() const
    {
        if (!isBoolean())
            throw std::runtime_error("Primitive is not a boolean type.");
        return booleanValue;
    }

    const std::string& Primitive::asString() const
    {
        if (!isString())
            throw std::runtime_error("Primitive is not a string type.");
        return stringValue;
    }

    std::string Primitive::toString() const
    {
        switch (type)
        {
        case PRIMITIVE_TYPE_INTEGER: return std::to_string(integerValue);
        case PRIMITIVE_TYPE_DOUBLE:
            {
                std::ostringstream out;
                out << doubleValue;
                return out.str();
            }
        case PRIMITIVE_TYPE_BOOLEAN: return booleanValue ? "true" : "false";
        case PRIMITIVE_TYPE_STRING: return stringValue;
        default: return "none";
        }
    }

    bool Primitive::operator==(const Primitive& other) const
    {
        if (type != other.type)
            return false;

        switch (type)
        {
        case PRIMITIVE_TYPE_INTEGER: return integerValue == other.integerValue;
        case PRIMITIVE_TYPE_DOUBLE: return doubleValue == other.doubleValue;
        case PRIMITIVE_TYPE_BOOLEAN: return booleanValue == other.booleanValue;
        case PRIMITIVE_TYPE_STRING: return stringValue == other.stringValue;
        default: return true;
        }
    }
}
