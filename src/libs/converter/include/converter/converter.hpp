#pragma once

#include <converter/config.hpp>
#include <drawio_model/vocabulary.hpp>
#include <string>
#include <string_view>

namespace converter {

// Runs the whole pipeline on a draw.io document: classification, endpoint
// resolution, block assembly and serialisation. Throws a ConversionError
// subclass on the first problem; nothing is produced in that case.
std::string convert(std::string_view raw_xml, const ConverterConfig& config,
    const drawio_model::Vocabulary& vocabulary = drawio_model::RicVocabulary::instance());

} // namespace converter
