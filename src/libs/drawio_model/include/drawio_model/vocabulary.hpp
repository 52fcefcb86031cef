#pragma once

#include <string>
#include <string_view>
#include <unordered_set>

namespace drawio_model {

// Marks labels carrying ontology terms, e.g. "rico:Person".
constexpr std::string_view namespace_prefix = "rico:";

// Membership queries over the permitted class and property names (without the
// namespace prefix).
class Vocabulary {
public:
    virtual ~Vocabulary() = default;

    virtual bool is_class(const std::string& name) const = 0;
    virtual bool is_object_property(const std::string& name) const = 0;
    virtual bool is_datatype_property(const std::string& name) const = 0;

    bool is_property(const std::string& name) const {
        return is_object_property(name) || is_datatype_property(name);
    }
};

// Records in Contexts ontology (RiC-O 1.0).
class RicVocabulary : public Vocabulary {
public:
    bool is_class(const std::string& name) const override;
    bool is_object_property(const std::string& name) const override;
    bool is_datatype_property(const std::string& name) const override;

    static const RicVocabulary& instance();
};

// Vocabulary over caller-supplied name sets.
class SetVocabulary : public Vocabulary {
public:
    SetVocabulary(std::unordered_set<std::string> classes,
        std::unordered_set<std::string> object_properties,
        std::unordered_set<std::string> datatype_properties);

    bool is_class(const std::string& name) const override;
    bool is_object_property(const std::string& name) const override;
    bool is_datatype_property(const std::string& name) const override;

private:
    std::unordered_set<std::string> classes_;
    std::unordered_set<std::string> object_properties_;
    std::unordered_set<std::string> datatype_properties_;
};

} // namespace drawio_model
