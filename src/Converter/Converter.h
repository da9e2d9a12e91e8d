#ifndef _CONVERTER_H_
#define _CONVERTER_H_

#include <cstdint>
#include <string>
#include <vector>
#include <future>
#include <filesystem>

#include "Converter/Types.h"
#include "TitleCatalog/TitleCatalog.h"

/*  Runs one ISO to GoD conversion:
    open image, read title, (stop here on a dry run), size payload, 
    clear output, write parts, chain hash tables, write header.
    Every failure is reported through the returned ConversionResult. */
class Converter 
{
public:
    Converter(const TitleCatalog& title_catalog);
    ~Converter() = default;

    ConversionResult convert(const ConversionRequest& request) const;

    // Runs convert() on its own thread. Only the catalog must outlive the future, this Converter need not.
    std::future<ConversionResult> convert_async(ConversionRequest request) const;

    static std::vector<uint8_t> read_icon(const std::filesystem::path& icon_path);

private:
    const TitleCatalog& title_catalog_;

    ConversionResult run(const ConversionRequest& request) const;
};

#endif // _CONVERTER_H_
