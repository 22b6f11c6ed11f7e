#include <gtest/gtest.h>

#include <cmath>
#include <stop_token>
#include <string>

#include "paste_lib.h"
#include "test_util.h"

using namespace paste_lib;
using paste_test::parse_text;

namespace
{
    // 3.3 absolute, millimetres, one 0.1mm circle selected
    std::string const header = "%FSLAX33Y33*%\n%MOMM*%\n%ADD10C,0.1*%\nD10*\n";

    bool has_problem(paste_file const &file, paste_error_code code)
    {
        for(auto const &p : file.stats.problems) {
            if(p.error_code == code) {
                return true;
            }
        }
        return false;
    }
}    // namespace

//////////////////////////////////////////////////////////////////////

TEST(InterpreterTest, SingleFlashEndToEnd)
{
    paste_file file;
    ASSERT_EQ(parse_text(file, header + "X1000Y2000D03*\nM02*\n"), ok);

    ASSERT_EQ(file.pad_count(), 1u);
    EXPECT_EQ(file.problem_count(), 0u);

    paste_pad const &pad = file.pads[0];
    EXPECT_EQ(pad.id, 1);
    EXPECT_EQ(pad.shape, shape_circle);
    EXPECT_NEAR(pad.position.x, 1.0, 1e-12);
    EXPECT_NEAR(pad.position.y, 2.0, 1e-12);
    EXPECT_NEAR(pad.area, 0.00785, 1e-5);
    EXPECT_NEAR(pad.area, M_PI * 0.05 * 0.05, 1e-12);
    EXPECT_DOUBLE_EQ(pad.default_thickness, 0.15);
    EXPECT_EQ(pad.aperture_number, 10);
    EXPECT_EQ(pad.line_number, 5);
    EXPECT_FALSE(file.incomplete);
}

TEST(InterpreterTest, ScaleFromFormatSpecification)
{
    paste_file file;
    ASSERT_EQ(parse_text(file, "%FSLAX33Y33*%\nX7550Y3850D02*\n"), ok);
    EXPECT_NEAR(file.state.current_x, 7.550, 1e-12);
    EXPECT_NEAR(file.state.current_y, 3.850, 1e-12);
    EXPECT_TRUE(file.format.specified);
    EXPECT_EQ(file.format.decimal_part_x, 3);
}

TEST(InterpreterTest, PerAxisScale)
{
    paste_file file;
    ASSERT_EQ(parse_text(file, "%FSLAX24Y35*%\nX15000Y15000D02*\n"), ok);
    EXPECT_NEAR(file.state.current_x, 1.5, 1e-12);
    EXPECT_NEAR(file.state.current_y, 0.15, 1e-12);
}

TEST(InterpreterTest, CoordinatesAreModal)
{
    paste_file file;
    ASSERT_EQ(parse_text(file, "%FSLAX33Y33*%\nX10000Y5000D02*\nX20000D02*\n"), ok);
    EXPECT_NEAR(file.state.current_x, 20.0, 1e-12);
    EXPECT_NEAR(file.state.current_y, 5.0, 1e-12);

    file.parse_line("Y7000D02*");
    EXPECT_NEAR(file.state.current_x, 20.0, 1e-12);
    EXPECT_NEAR(file.state.current_y, 7.0, 1e-12);
}

TEST(InterpreterTest, FlashUsesModalCoordinates)
{
    paste_file file;
    ASSERT_EQ(parse_text(file, header + "X1000Y1000D03*\nX2000D03*\nY3000D03*\nD03*\n"), ok);
    ASSERT_EQ(file.pad_count(), 4u);
    EXPECT_NEAR(file.pads[1].position.x, 2.0, 1e-12);
    EXPECT_NEAR(file.pads[1].position.y, 1.0, 1e-12);
    EXPECT_NEAR(file.pads[2].position.y, 3.0, 1e-12);
    EXPECT_NEAR(file.pads[3].position.x, 2.0, 1e-12);
    EXPECT_NEAR(file.pads[3].position.y, 3.0, 1e-12);
}

TEST(InterpreterTest, NegativeCoordinates)
{
    paste_file file;
    ASSERT_EQ(parse_text(file, header + "X-1500Y-250D03*\n"), ok);
    ASSERT_EQ(file.pad_count(), 1u);
    EXPECT_NEAR(file.pads[0].position.x, -1.5, 1e-12);
    EXPECT_NEAR(file.pads[0].position.y, -0.25, 1e-12);
}

TEST(InterpreterTest, TrailingZeroOmission)
{
    paste_file file;
    ASSERT_EQ(parse_text(file, "%FSTAX24Y24*%\nX15Y025D02*\n"), ok);
    EXPECT_NEAR(file.state.current_x, 15.0, 1e-12);
    EXPECT_NEAR(file.state.current_y, 2.5, 1e-12);
}

TEST(InterpreterTest, PadIdsHaveNoGaps)
{
    std::string text = "%FSLAX33Y33*%\n"
                       "X0Y0D03*\n"              // no aperture yet
                       "%ADD10C,0.1*%\n"
                       "%ADD11C,0*%\n"
                       "garbage line\n"
                       "D10*\n"
                       "X1000D03*\n"
                       "D12*\n"
                       "X2000D03*\n"            // D12 undefined
                       "D11*\n"
                       "X2500D03*\n"            // zero size
                       "D10*\n"
                       "X3000D03*\n"
                       "X4000D03*\n";
    paste_file file;
    ASSERT_EQ(parse_text(file, text), ok);
    ASSERT_EQ(file.pad_count(), 3u);
    for(size_t i = 0; i < file.pads.size(); ++i) {
        EXPECT_EQ(file.pads[i].id, static_cast<int>(i) + 1);
    }
    EXPECT_NEAR(file.pads[2].position.x, 4.0, 1e-12);
    EXPECT_EQ(file.stats.flashes_rejected, 3);
    EXPECT_TRUE(has_problem(file, error_no_aperture_selected));
    EXPECT_TRUE(has_problem(file, error_undefined_aperture));
    EXPECT_TRUE(has_problem(file, error_degenerate_pad));
    EXPECT_TRUE(has_problem(file, error_unknown_command));
    EXPECT_EQ(file.problem_count(), 4u);
}

TEST(InterpreterTest, PadCountMatchesGoodFlashes)
{
    std::string text = header;
    for(int i = 0; i < 50; ++i) {
        text += "X" + std::to_string(i * 1000) + "Y0D03*\n";
        text += "X" + std::to_string(i * 1000) + "Y500D02*\n";
    }
    paste_file file;
    ASSERT_EQ(parse_text(file, text), ok);
    EXPECT_EQ(file.pad_count(), 50u);
    EXPECT_EQ(file.stats.d3, 50);
    EXPECT_EQ(file.stats.d2, 50);
    EXPECT_EQ(file.problem_count(), 0u);
}

TEST(InterpreterTest, RectangleApertures)
{
    paste_file file;
    ASSERT_EQ(parse_text(file, "%FSLAX33Y33*%\n%ADD11R,0.5X0.3*%\n%ADD12R,0.4*%\nD11*\nX0Y0D03*\nD12*\nX1000D03*\n"), ok);
    ASSERT_EQ(file.pad_count(), 2u);
    EXPECT_EQ(file.pads[0].shape, shape_rectangle);
    EXPECT_NEAR(file.pads[0].area, 0.15, 1e-12);
    EXPECT_NEAR(file.pads[0].length, 0.5, 1e-12);
    EXPECT_NEAR(file.pads[0].width, 0.3, 1e-12);
    EXPECT_NEAR(file.pads[1].area, 0.16, 1e-12);
    EXPECT_NEAR(file.pads[1].bounds.min_pos.x, 0.8, 1e-12);
}

TEST(InterpreterTest, RedefinitionOverwritesSilently)
{
    paste_file file;
    ASSERT_EQ(parse_text(file, "%FSLAX33Y33*%\n%ADD10C,0.1*%\n%ADD10C,0.2*%\nD10*\nX0Y0D03*\n"), ok);
    ASSERT_EQ(file.pad_count(), 1u);
    EXPECT_NEAR(file.pads[0].length, 0.2, 1e-12);
    EXPECT_EQ(file.stats.aperture_redefinitions, 1);
    EXPECT_EQ(file.problem_count(), 0u);
}

TEST(InterpreterTest, MalformedLineLeavesCursorAlone)
{
    paste_file file;
    ASSERT_EQ(parse_text(file, header + "X1000Y1000D02*\nX12A34D03*\nX5000Q1D02*\n"), ok);
    EXPECT_EQ(file.pad_count(), 0u);
    EXPECT_NEAR(file.state.current_x, 1.0, 1e-12);
    EXPECT_NEAR(file.state.current_y, 1.0, 1e-12);
    EXPECT_EQ(file.problem_count(), 2u);
}

TEST(InterpreterTest, InertCommandsAreNotProblems)
{
    std::string text = "G04 paste layer*\n"
                       "%TF.FileFunction,Paste,Top*%\n"
                       "%TA.AperFunction,SMDPad,CuDef*%\n"
                       "%FSLAX46Y46*%\n"
                       "%MOMM*%\n"
                       "%LPD*%\n"
                       "%IPPOS*%\n"
                       "G75*\n"
                       "G01*\n"
                       "G90*\n"
                       "%ADD10C,0.500000*%\n"
                       "%TD*%\n"
                       "G54D10*\n"
                       "G01X1000000Y1000000D03*\n"
                       "M02*\n";
    paste_file file;
    ASSERT_EQ(parse_text(file, text), ok);
    EXPECT_EQ(file.problem_count(), 0u);
    ASSERT_EQ(file.pad_count(), 1u);
    EXPECT_NEAR(file.pads[0].position.x, 1.0, 1e-12);
    EXPECT_EQ(file.stats.comments, 1);
    EXPECT_EQ(file.stats.aperture_selects, 1);
}

TEST(InterpreterTest, UnsupportedCommandsAreProblems)
{
    paste_file file;
    ASSERT_EQ(parse_text(file, header + "G02*\nG36*\nG91*\n%SRX2Y2I1J1*%\n%ADD20O,1X0.5*%\nD0*\nQ12*\n"), ok);
    EXPECT_EQ(file.problem_count(), 7u);
    EXPECT_TRUE(has_problem(file, error_unsupported_command));
    EXPECT_TRUE(has_problem(file, error_incremental_not_supported));
    EXPECT_TRUE(has_problem(file, error_unsupported_aperture_type));
    EXPECT_TRUE(has_problem(file, error_bad_aperture_number));
    EXPECT_TRUE(has_problem(file, error_unknown_command));
    EXPECT_FALSE(file.apertures.contains(20));
}

TEST(InterpreterTest, AnyPositiveApertureNumber)
{
    std::string text = "%FSLAX33Y33*%\n%MOMM*%\n"
                       "%ADD5C,0.1*%\n"
                       "%ADD10000R,0.2X0.1*%\n"
                       "D5*\n"
                       "X1000Y1000D03*\n"
                       "D10000*\n"
                       "X2000Y1000D03*\n"
                       "G54D5*\n"
                       "X3000Y1000D03*\n";
    paste_file file;
    ASSERT_EQ(parse_text(file, text), ok);
    EXPECT_EQ(file.problem_count(), 0u);
    ASSERT_EQ(file.pad_count(), 3u);
    EXPECT_EQ(file.pads[0].aperture_number, 5);
    EXPECT_EQ(file.pads[1].aperture_number, 10000);
    EXPECT_EQ(file.pads[1].shape, shape_rectangle);
    EXPECT_EQ(file.pads[2].aperture_number, 5);
}

TEST(InterpreterTest, LowDCodesAreOperationsNotSelects)
{
    // D3 on its own flashes with D10 still selected
    paste_file file;
    ASSERT_EQ(parse_text(file, header + "%ADD3C,0.2*%\nX1000Y1000D02*\nD3*\n"), ok);
    EXPECT_EQ(file.problem_count(), 0u);
    EXPECT_TRUE(file.apertures.contains(3));
    ASSERT_EQ(file.pad_count(), 1u);
    EXPECT_EQ(file.pads[0].aperture_number, 10);
    EXPECT_EQ(file.state.current_aperture, 10);
}

TEST(InterpreterTest, MultiLineMacroIsOneProblem)
{
    std::string text = "%FSLAX33Y33*%\n"
                       "%AMOC8*\n"
                       "5,1,8,0,0,1.08239X$1,22.5*\n"
                       "%\n"
                       "%ADD10C,0.1*%\n"
                       "D10*\n"
                       "X0Y0D03*\n";
    paste_file file;
    ASSERT_EQ(parse_text(file, text), ok);
    EXPECT_EQ(file.problem_count(), 1u);
    EXPECT_EQ(file.stats.aperture_macros, 1);
    EXPECT_EQ(file.pad_count(), 1u);
    EXPECT_FALSE(file.state.in_aperture_macro);
}

TEST(InterpreterTest, IncrementalFormatIsRejected)
{
    paste_file file;
    ASSERT_EQ(parse_text(file, "%FSLIX33Y33*%\n"), ok);
    EXPECT_FALSE(file.format.specified);
    EXPECT_TRUE(has_problem(file, error_incremental_not_supported));
}

TEST(InterpreterTest, BadFormatSpecifications)
{
    paste_file file;
    ASSERT_EQ(parse_text(file, "%FSQAX33Y33*%\n%FSLAX3Y33*%\n%FSLAX33*%\n%FSLAX73Y33*%\n"), ok);
    EXPECT_EQ(file.problem_count(), 4u);
    EXPECT_FALSE(file.format.specified);
}

TEST(InterpreterTest, SecondFormatSpecificationReplacesFirst)
{
    paste_file file;
    ASSERT_EQ(parse_text(file, "%FSLAX33Y33*%\n%FSLAX24Y24*%\nX10000Y10000D02*\n"), ok);
    EXPECT_EQ(file.problem_count(), 0u);
    EXPECT_NEAR(file.state.current_x, 1.0, 1e-12);
}

TEST(InterpreterTest, MissingFormatUsesUnitScale)
{
    paste_file file;
    ASSERT_EQ(parse_text(file, "%ADD10C,0.1*%\nD10*\nX3Y4D03*\n"), ok);
    EXPECT_EQ(file.problem_count(), 0u);
    ASSERT_EQ(file.pad_count(), 1u);
    EXPECT_DOUBLE_EQ(file.pads[0].position.x, 3.0);
    EXPECT_DOUBLE_EQ(file.pads[0].position.y, 4.0);
}

TEST(InterpreterTest, InchUnits)
{
    paste_file file;
    ASSERT_EQ(parse_text(file, "%FSLAX24Y24*%\n%MOIN*%\n%ADD10C,0.01*%\nD10*\nX10000Y0D03*\n"), ok);
    EXPECT_EQ(file.unit, unit_inch);
    ASSERT_EQ(file.pad_count(), 1u);
    EXPECT_DOUBLE_EQ(file.pads[0].default_thickness, 0.15 / 25.4);
}

TEST(InterpreterTest, DeprecatedUnitCodes)
{
    paste_file file;
    ASSERT_EQ(parse_text(file, "G70*\n"), ok);
    EXPECT_EQ(file.unit, unit_inch);
    file.parse_line("G71*");
    EXPECT_EQ(file.unit, unit_millimeter);
    file.parse_line("%MOFT*%");
    EXPECT_EQ(file.problem_count(), 1u);
}

TEST(InterpreterTest, EndOfFileStopsProcessing)
{
    paste_file file;
    ASSERT_EQ(parse_text(file, header + "X0Y0D03*\nM02*\nX1000Y0D03*\n"), ok);
    EXPECT_EQ(file.pad_count(), 1u);
    EXPECT_TRUE(file.state.end_of_file);
}

TEST(InterpreterTest, WindowsLineEndings)
{
    std::string text = "%FSLAX33Y33*%\r\n%ADD10C,0.1*%\r\nD10*\r\nX1000Y2000D03*\r\n";
    paste_file file;
    ASSERT_EQ(parse_text(file, text), ok);
    EXPECT_EQ(file.problem_count(), 0u);
    EXPECT_EQ(file.pad_count(), 1u);
}

TEST(InterpreterTest, StopTokenLeavesParseIncomplete)
{
    std::string text = header + "X0Y0D03*\n";
    std::stop_source stop;
    stop.request_stop();

    paste_file file;
    ASSERT_EQ(file.parse_memory(text.data(), text.size(), stop.get_token()), ok);
    EXPECT_TRUE(file.incomplete);
    EXPECT_EQ(file.pad_count(), 0u);
}

TEST(InterpreterTest, ReparseResetsState)
{
    paste_file file;
    ASSERT_EQ(parse_text(file, header + "X0Y0D03*\nQ*\n"), ok);
    EXPECT_EQ(file.pad_count(), 1u);
    ASSERT_EQ(parse_text(file, "G04 nothing*\n"), ok);
    EXPECT_EQ(file.pad_count(), 0u);
    EXPECT_EQ(file.problem_count(), 0u);
    EXPECT_EQ(file.apertures.size(), 0u);
    EXPECT_FALSE(file.format.specified);
}

TEST(InterpreterTest, ExtentCoversAllPads)
{
    paste_file file;
    EXPECT_DOUBLE_EQ(file.extent().area(), 0);
    ASSERT_EQ(parse_text(file, header + "X0Y0D03*\nX2000Y1000D03*\n"), ok);
    rect r = file.extent();
    EXPECT_NEAR(r.min_pos.x, -0.05, 1e-12);
    EXPECT_NEAR(r.max_pos.x, 2.05, 1e-12);
    EXPECT_NEAR(r.max_pos.y, 1.05, 1e-12);
}

TEST(InterpreterTest, FileErrorsAreFatal)
{
    paste_file file;
    EXPECT_EQ(file.parse_file("/this/path/does/not/exist.gtp"), error_file_not_found);

    EXPECT_EQ(file.pad_count(), 0u);
}

TEST(InterpreterTest, EmptyStreamHasNoPads)
{
    paste_test::temp_file empty("paste_interpreter_empty.gtp", "");
    paste_file file;
    EXPECT_EQ(file.parse_file(empty.name().c_str()), ok);
    EXPECT_EQ(file.pad_count(), 0u);
    EXPECT_EQ(file.problem_count(), 0u);
    EXPECT_FALSE(file.incomplete);

    EXPECT_EQ(file.parse_memory("", 0), ok);
    EXPECT_EQ(file.pad_count(), 0u);
    EXPECT_EQ(file.problem_count(), 0u);
}

TEST(InterpreterTest, ParsesFromFile)
{
    paste_test::temp_file gtp("paste_interpreter_board.gtp", header + "X1000Y2000D03*\nM02*\n");
    paste_file file;
    ASSERT_EQ(file.parse_file(gtp.name().c_str()), ok);
    EXPECT_EQ(file.pad_count(), 1u);
    EXPECT_EQ(file.filename, gtp.name());
}
