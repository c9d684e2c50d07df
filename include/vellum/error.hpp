#pragma once

#include <functional>
#include <stdexcept>
#include <string>

namespace vellum
{

class Primitive;

// Base of every error raised by the library. what() carries the error kind
// as a prefix, e.g. "ConfigurationError: chart type 'pie' is not supported".
class Error : public std::runtime_error
{
   public:
    Error(const std::string& kind, const std::string& message)
        : std::runtime_error(kind + ": " + message), kind_(kind), detail_(message)
    {
    }

    const std::string& kind() const noexcept { return kind_; }
    const std::string& detail() const noexcept { return detail_; }

   private:
    std::string kind_;
    std::string detail_;
};

// Missing or unsupported top-level chart setup. Raised before any primitive exists.
class ConfigurationError : public Error
{
   public:
    explicit ConfigurationError(const std::string& message) : Error("ConfigurationError", message)
    {
    }
};

// Malformed source data, raised by SeriesData::refresh().
class ValidationError : public Error
{
   public:
    explicit ValidationError(const std::string& message) : Error("ValidationError", message) {}
};

// A primitive kind was defined incorrectly. Raised at definition time only.
class PrimitiveDefinitionError : public Error
{
   public:
    explicit PrimitiveDefinitionError(const std::string& message)
        : Error("PrimitiveDefinitionError", message)
    {
    }
};

// One property of an animate()/transition() call could not be animated.
// Recoverable: reported in AnimateResult, never thrown by animate().
class AnimationPropertyError : public Error
{
   public:
    AnimationPropertyError(const std::string& property, const std::string& message)
        : Error("AnimationPropertyError", "property '" + property + "' " + message),
          property_(property)
    {
    }

    const std::string& property() const noexcept { return property_; }

   private:
    std::string property_;
};

// Unknown easing name. Only ever used as a log message: lookups substitute
// the default easing instead of raising it.
class EasingNotFoundError : public Error
{
   public:
    explicit EasingNotFoundError(const std::string& name)
        : Error("EasingNotFoundError", "easing '" + name + "' does not exist"), name_(name)
    {
    }

    const std::string& name() const noexcept { return name_; }

   private:
    std::string name_;
};

// An exception isolated at a per-primitive boundary (render, update or a
// pointer event handler). primitive is null for faults outside any primitive.
struct Fault
{
    std::string      stage;
    const Primitive* primitive = nullptr;
    std::string      message;
};

using FaultHandler = std::function<void(const Fault&)>;

}   // namespace vellum
