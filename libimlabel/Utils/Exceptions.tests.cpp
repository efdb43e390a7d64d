#include "Exceptions.h"

#include <gtest/gtest.h>

#include <string>

using namespace iml;

TEST(Exceptions, each_exception_type_reports_its_kind)
{
    ASSERT_EQ(InvalidGeometry{"x"}.kind(), ErrorKind::InvalidGeometry);
    ASSERT_EQ(InvalidZoom{"x"}.kind(), ErrorKind::InvalidZoom);
    ASSERT_EQ(NotFound{"x"}.kind(), ErrorKind::NotFound);
    ASSERT_EQ(DuplicateLabel{"x"}.kind(), ErrorKind::DuplicateLabel);
    ASSERT_EQ(LabelInUse{"x"}.kind(), ErrorKind::LabelInUse);
    ASSERT_EQ(NothingToUndo{}.kind(), ErrorKind::NothingToUndo);
    ASSERT_EQ(NothingToRedo{}.kind(), ErrorKind::NothingToRedo);
    ASSERT_EQ(MalformedInput({}, "x").kind(), ErrorKind::MalformedInput);
    ASSERT_EQ(UnsupportedKind({}, "x").kind(), ErrorKind::UnsupportedKind);
}

TEST(Exceptions, can_be_caught_via_base_class)
{
    ASSERT_THROW({ throw NotFound{"annotation 7"}; }, Exception);
    ASSERT_THROW({ throw NotFound{"annotation 7"}; }, std::runtime_error);
}

TEST(Exceptions, codec_exception_message_contains_location_and_reason)
{
    const MalformedInput ex{{.source = "dog.json", .image_index = 2, .annotation_index = 5}, "missing 'type'"};
    const std::string msg = ex.what();
    ASSERT_NE(msg.find("dog.json"), std::string::npos);
    ASSERT_NE(msg.find("image[2]"), std::string::npos);
    ASSERT_NE(msg.find("annotation[5]"), std::string::npos);
    ASSERT_NE(msg.find("missing 'type'"), std::string::npos);
    ASSERT_EQ(ex.reason(), "missing 'type'");
    ASSERT_EQ(ex.location().annotation_index, 5);
}

TEST(Exceptions, location_without_source_prints_placeholder)
{
    ASSERT_EQ(to_string(CodecErrorLocation{.byte_offset = 12}), "<input> (byte 12)");
}

TEST(ErrorKind, to_string_view_returns_kind_name)
{
    ASSERT_EQ(to_string_view(ErrorKind::LabelInUse), "LabelInUse");
}
