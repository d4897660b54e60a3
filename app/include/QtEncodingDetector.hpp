#ifndef QT_ENCODING_DETECTOR_HPP
#define QT_ENCODING_DETECTOR_HPP

#include "Capabilities.hpp"

/**
 * @brief Encoding guess based on byte order marks and UTF-8 validity.
 *
 * A BOM (UTF-8/16/32) wins; otherwise valid UTF-8 is reported as "UTF-8",
 * a prefix with an interleaved NUL pattern as UTF-16, and anything else as
 * "ISO-8859-1", which decodes every byte.
 */
class QtEncodingDetector : public IEncodingDetector {
public:
    std::optional<std::string> detect(std::string_view prefix) const override;
};

#endif
