// =============================================================================
// MFCONV - EBCDIC Conversion Module Implementation
// Version: 1.2.0
// =============================================================================

#include <mfconv/ebcdic/ebcdic.hpp>
#include <algorithm>

namespace mfconv {
namespace ebcdic {

// =============================================================================
// Translation Tables
// =============================================================================

const std::array<char32_t, 256> IBM037_TO_UNICODE = {{
    0x0000, 0x0001, 0x0002, 0x0003, 0x009C, 0x0009, 0x0086, 0x007F,  // 00-07
    0x0097, 0x008D, 0x008E, 0x000B, 0x000C, 0x000D, 0x000E, 0x000F,  // 08-0F
    0x0010, 0x0011, 0x0012, 0x0013, 0x009D, 0x0085, 0x0008, 0x0087,  // 10-17
    0x0018, 0x0019, 0x0092, 0x008F, 0x001C, 0x001D, 0x001E, 0x001F,  // 18-1F
    0x0080, 0x0081, 0x0082, 0x0083, 0x0084, 0x000A, 0x0017, 0x001B,  // 20-27
    0x0088, 0x0089, 0x008A, 0x008B, 0x008C, 0x0005, 0x0006, 0x0007,  // 28-2F
    0x0090, 0x0091, 0x0016, 0x0093, 0x0094, 0x0095, 0x0096, 0x0004,  // 30-37
    0x0098, 0x0099, 0x009A, 0x009B, 0x0014, 0x0015, 0x009E, 0x001A,  // 38-3F
    0x0020, 0x00A0, 0x00E2, 0x00E4, 0x00E0, 0x00E1, 0x00E3, 0x00E5,  // 40-47
    0x00E7, 0x00F1, 0x00A2, 0x002E, 0x003C, 0x0028, 0x002B, 0x007C,  // 48-4F
    0x0026, 0x00E9, 0x00EA, 0x00EB, 0x00E8, 0x00ED, 0x00EE, 0x00EF,  // 50-57
    0x00EC, 0x00DF, 0x0021, 0x0024, 0x002A, 0x0029, 0x003B, 0x00AC,  // 58-5F
    0x002D, 0x002F, 0x00C2, 0x00C4, 0x00C0, 0x00C1, 0x00C3, 0x00C5,  // 60-67
    0x00C7, 0x00D1, 0x00A6, 0x002C, 0x0025, 0x005F, 0x003E, 0x003F,  // 68-6F
    0x00F8, 0x00C9, 0x00CA, 0x00CB, 0x00C8, 0x00CD, 0x00CE, 0x00CF,  // 70-77
    0x00CC, 0x0060, 0x003A, 0x0023, 0x0040, 0x0027, 0x003D, 0x0022,  // 78-7F
    0x00D8, 0x0061, 0x0062, 0x0063, 0x0064, 0x0065, 0x0066, 0x0067,  // 80-87
    0x0068, 0x0069, 0x00AB, 0x00BB, 0x00F0, 0x00FD, 0x00FE, 0x00B1,  // 88-8F
    0x00B0, 0x006A, 0x006B, 0x006C, 0x006D, 0x006E, 0x006F, 0x0070,  // 90-97
    0x0071, 0x0072, 0x00AA, 0x00BA, 0x00E6, 0x00B8, 0x00C6, 0x00A4,  // 98-9F
    0x00B5, 0x007E, 0x0073, 0x0074, 0x0075, 0x0076, 0x0077, 0x0078,  // A0-A7
    0x0079, 0x007A, 0x00A1, 0x00BF, 0x00D0, 0x00DD, 0x00DE, 0x00AE,  // A8-AF
    0x005E, 0x00A3, 0x00A5, 0x00B7, 0x00A9, 0x00A7, 0x00B6, 0x00BC,  // B0-B7
    0x00BD, 0x00BE, 0x005B, 0x005D, 0x00AF, 0x00A8, 0x00B4, 0x00D7,  // B8-BF
    0x007B, 0x0041, 0x0042, 0x0043, 0x0044, 0x0045, 0x0046, 0x0047,  // C0-C7
    0x0048, 0x0049, 0x00AD, 0x00F4, 0x00F6, 0x00F2, 0x00F3, 0x00F5,  // C8-CF
    0x007D, 0x004A, 0x004B, 0x004C, 0x004D, 0x004E, 0x004F, 0x0050,  // D0-D7
    0x0051, 0x0052, 0x00B9, 0x00FB, 0x00FC, 0x00F9, 0x00FA, 0x00FF,  // D8-DF
    0x005C, 0x00F7, 0x0053, 0x0054, 0x0055, 0x0056, 0x0057, 0x0058,  // E0-E7
    0x0059, 0x005A, 0x00B2, 0x00D4, 0x00D6, 0x00D2, 0x00D3, 0x00D5,  // E8-EF
    0x0030, 0x0031, 0x0032, 0x0033, 0x0034, 0x0035, 0x0036, 0x0037,  // F0-F7
    0x0038, 0x0039, 0x00B3, 0x00DB, 0x00DC, 0x00D9, 0x00DA, 0x009F   // F8-FF
}};

const std::array<char32_t, 256> IBM273_TO_UNICODE = {{
    0x0000, 0x0001, 0x0002, 0x0003, 0x009C, 0x0009, 0x0086, 0x007F,  // 00-07
    0x0097, 0x008D, 0x008E, 0x000B, 0x000C, 0x000D, 0x000E, 0x000F,  // 08-0F
    0x0010, 0x0011, 0x0012, 0x0013, 0x009D, 0x0085, 0x0008, 0x0087,  // 10-17
    0x0018, 0x0019, 0x0092, 0x008F, 0x001C, 0x001D, 0x001E, 0x001F,  // 18-1F
    0x0080, 0x0081, 0x0082, 0x0083, 0x0084, 0x000A, 0x0017, 0x001B,  // 20-27
    0x0088, 0x0089, 0x008A, 0x008B, 0x008C, 0x0005, 0x0006, 0x0007,  // 28-2F
    0x0090, 0x0091, 0x0016, 0x0093, 0x0094, 0x0095, 0x0096, 0x0004,  // 30-37
    0x0098, 0x0099, 0x009A, 0x009B, 0x0014, 0x0015, 0x009E, 0x001A,  // 38-3F
    0x0020, 0x00A0, 0x00E2, 0x007B, 0x00E0, 0x00E1, 0x00E3, 0x00E5,  // 40-47
    0x00E7, 0x00F1, 0x00C4, 0x002E, 0x003C, 0x0028, 0x002B, 0x0021,  // 48-4F
    0x0026, 0x00E9, 0x00EA, 0x00EB, 0x00E8, 0x00ED, 0x00EE, 0x00EF,  // 50-57
    0x00EC, 0x007E, 0x00DC, 0x0024, 0x002A, 0x0029, 0x003B, 0x005E,  // 58-5F
    0x002D, 0x002F, 0x00C2, 0x005B, 0x00C0, 0x00C1, 0x00C3, 0x00C5,  // 60-67
    0x00C7, 0x00D1, 0x00F6, 0x002C, 0x0025, 0x005F, 0x003E, 0x003F,  // 68-6F
    0x00F8, 0x00C9, 0x00CA, 0x00CB, 0x00C8, 0x00CD, 0x00CE, 0x00CF,  // 70-77
    0x00CC, 0x0060, 0x003A, 0x0023, 0x00A7, 0x0027, 0x003D, 0x0022,  // 78-7F
    0x00D8, 0x0061, 0x0062, 0x0063, 0x0064, 0x0065, 0x0066, 0x0067,  // 80-87
    0x0068, 0x0069, 0x00AB, 0x00BB, 0x00F0, 0x00FD, 0x00FE, 0x00B1,  // 88-8F
    0x00B0, 0x006A, 0x006B, 0x006C, 0x006D, 0x006E, 0x006F, 0x0070,  // 90-97
    0x0071, 0x0072, 0x00AA, 0x00BA, 0x00E6, 0x00B8, 0x00C6, 0x00A4,  // 98-9F
    0x00B5, 0x00DF, 0x0073, 0x0074, 0x0075, 0x0076, 0x0077, 0x0078,  // A0-A7
    0x0079, 0x007A, 0x00A1, 0x00BF, 0x00D0, 0x00DD, 0x00DE, 0x00AE,  // A8-AF
    0x00A2, 0x00A3, 0x00A5, 0x00B7, 0x00A9, 0x0040, 0x00B6, 0x00BC,  // B0-B7
    0x00BD, 0x00BE, 0x00AC, 0x007C, 0x203E, 0x00A8, 0x00B4, 0x00D7,  // B8-BF
    0x00E4, 0x0041, 0x0042, 0x0043, 0x0044, 0x0045, 0x0046, 0x0047,  // C0-C7
    0x0048, 0x0049, 0x00AD, 0x00F4, 0x00A6, 0x00F2, 0x00F3, 0x00F5,  // C8-CF
    0x00FC, 0x004A, 0x004B, 0x004C, 0x004D, 0x004E, 0x004F, 0x0050,  // D0-D7
    0x0051, 0x0052, 0x00B9, 0x00FB, 0x007D, 0x00F9, 0x00FA, 0x00FF,  // D8-DF
    0x00D6, 0x00F7, 0x0053, 0x0054, 0x0055, 0x0056, 0x0057, 0x0058,  // E0-E7
    0x0059, 0x005A, 0x00B2, 0x00D4, 0x005C, 0x00D2, 0x00D3, 0x00D5,  // E8-EF
    0x0030, 0x0031, 0x0032, 0x0033, 0x0034, 0x0035, 0x0036, 0x0037,  // F0-F7
    0x0038, 0x0039, 0x00B3, 0x00DB, 0x005D, 0x00D9, 0x00DA, 0x009F   // F8-FF
}};

const std::array<char32_t, 256> IBM500_TO_UNICODE = {{
    0x0000, 0x0001, 0x0002, 0x0003, 0x009C, 0x0009, 0x0086, 0x007F,  // 00-07
    0x0097, 0x008D, 0x008E, 0x000B, 0x000C, 0x000D, 0x000E, 0x000F,  // 08-0F
    0x0010, 0x0011, 0x0012, 0x0013, 0x009D, 0x0085, 0x0008, 0x0087,  // 10-17
    0x0018, 0x0019, 0x0092, 0x008F, 0x001C, 0x001D, 0x001E, 0x001F,  // 18-1F
    0x0080, 0x0081, 0x0082, 0x0083, 0x0084, 0x000A, 0x0017, 0x001B,  // 20-27
    0x0088, 0x0089, 0x008A, 0x008B, 0x008C, 0x0005, 0x0006, 0x0007,  // 28-2F
    0x0090, 0x0091, 0x0016, 0x0093, 0x0094, 0x0095, 0x0096, 0x0004,  // 30-37
    0x0098, 0x0099, 0x009A, 0x009B, 0x0014, 0x0015, 0x009E, 0x001A,  // 38-3F
    0x0020, 0x00A0, 0x00E2, 0x00E4, 0x00E0, 0x00E1, 0x00E3, 0x00E5,  // 40-47
    0x00E7, 0x00F1, 0x005B, 0x002E, 0x003C, 0x0028, 0x002B, 0x0021,  // 48-4F
    0x0026, 0x00E9, 0x00EA, 0x00EB, 0x00E8, 0x00ED, 0x00EE, 0x00EF,  // 50-57
    0x00EC, 0x00DF, 0x005D, 0x0024, 0x002A, 0x0029, 0x003B, 0x005E,  // 58-5F
    0x002D, 0x002F, 0x00C2, 0x00C4, 0x00C0, 0x00C1, 0x00C3, 0x00C5,  // 60-67
    0x00C7, 0x00D1, 0x00A6, 0x002C, 0x0025, 0x005F, 0x003E, 0x003F,  // 68-6F
    0x00F8, 0x00C9, 0x00CA, 0x00CB, 0x00C8, 0x00CD, 0x00CE, 0x00CF,  // 70-77
    0x00CC, 0x0060, 0x003A, 0x0023, 0x0040, 0x0027, 0x003D, 0x0022,  // 78-7F
    0x00D8, 0x0061, 0x0062, 0x0063, 0x0064, 0x0065, 0x0066, 0x0067,  // 80-87
    0x0068, 0x0069, 0x00AB, 0x00BB, 0x00F0, 0x00FD, 0x00FE, 0x00B1,  // 88-8F
    0x00B0, 0x006A, 0x006B, 0x006C, 0x006D, 0x006E, 0x006F, 0x0070,  // 90-97
    0x0071, 0x0072, 0x00AA, 0x00BA, 0x00E6, 0x00B8, 0x00C6, 0x00A4,  // 98-9F
    0x00B5, 0x007E, 0x0073, 0x0074, 0x0075, 0x0076, 0x0077, 0x0078,  // A0-A7
    0x0079, 0x007A, 0x00A1, 0x00BF, 0x00D0, 0x00DD, 0x00DE, 0x00AE,  // A8-AF
    0x00A2, 0x00A3, 0x00A5, 0x00B7, 0x00A9, 0x00A7, 0x00B6, 0x00BC,  // B0-B7
    0x00BD, 0x00BE, 0x00AC, 0x007C, 0x00AF, 0x00A8, 0x00B4, 0x00D7,  // B8-BF
    0x007B, 0x0041, 0x0042, 0x0043, 0x0044, 0x0045, 0x0046, 0x0047,  // C0-C7
    0x0048, 0x0049, 0x00AD, 0x00F4, 0x00F6, 0x00F2, 0x00F3, 0x00F5,  // C8-CF
    0x007D, 0x004A, 0x004B, 0x004C, 0x004D, 0x004E, 0x004F, 0x0050,  // D0-D7
    0x0051, 0x0052, 0x00B9, 0x00FB, 0x00FC, 0x00F9, 0x00FA, 0x00FF,  // D8-DF
    0x005C, 0x00F7, 0x0053, 0x0054, 0x0055, 0x0056, 0x0057, 0x0058,  // E0-E7
    0x0059, 0x005A, 0x00B2, 0x00D4, 0x00D6, 0x00D2, 0x00D3, 0x00D5,  // E8-EF
    0x0030, 0x0031, 0x0032, 0x0033, 0x0034, 0x0035, 0x0036, 0x0037,  // F0-F7
    0x0038, 0x0039, 0x00B3, 0x00DB, 0x00DC, 0x00D9, 0x00DA, 0x009F   // F8-FF
}};

const std::array<char32_t, 256> IBM1140_TO_UNICODE = {{
    0x0000, 0x0001, 0x0002, 0x0003, 0x009C, 0x0009, 0x0086, 0x007F,  // 00-07
    0x0097, 0x008D, 0x008E, 0x000B, 0x000C, 0x000D, 0x000E, 0x000F,  // 08-0F
    0x0010, 0x0011, 0x0012, 0x0013, 0x009D, 0x0085, 0x0008, 0x0087,  // 10-17
    0x0018, 0x0019, 0x0092, 0x008F, 0x001C, 0x001D, 0x001E, 0x001F,  // 18-1F
    0x0080, 0x0081, 0x0082, 0x0083, 0x0084, 0x000A, 0x0017, 0x001B,  // 20-27
    0x0088, 0x0089, 0x008A, 0x008B, 0x008C, 0x0005, 0x0006, 0x0007,  // 28-2F
    0x0090, 0x0091, 0x0016, 0x0093, 0x0094, 0x0095, 0x0096, 0x0004,  // 30-37
    0x0098, 0x0099, 0x009A, 0x009B, 0x0014, 0x0015, 0x009E, 0x001A,  // 38-3F
    0x0020, 0x00A0, 0x00E2, 0x00E4, 0x00E0, 0x00E1, 0x00E3, 0x00E5,  // 40-47
    0x00E7, 0x00F1, 0x00A2, 0x002E, 0x003C, 0x0028, 0x002B, 0x007C,  // 48-4F
    0x0026, 0x00E9, 0x00EA, 0x00EB, 0x00E8, 0x00ED, 0x00EE, 0x00EF,  // 50-57
    0x00EC, 0x00DF, 0x0021, 0x0024, 0x002A, 0x0029, 0x003B, 0x00AC,  // 58-5F
    0x002D, 0x002F, 0x00C2, 0x00C4, 0x00C0, 0x00C1, 0x00C3, 0x00C5,  // 60-67
    0x00C7, 0x00D1, 0x00A6, 0x002C, 0x0025, 0x005F, 0x003E, 0x003F,  // 68-6F
    0x00F8, 0x00C9, 0x00CA, 0x00CB, 0x00C8, 0x00CD, 0x00CE, 0x00CF,  // 70-77
    0x00CC, 0x0060, 0x003A, 0x0023, 0x0040, 0x0027, 0x003D, 0x0022,  // 78-7F
    0x00D8, 0x0061, 0x0062, 0x0063, 0x0064, 0x0065, 0x0066, 0x0067,  // 80-87
    0x0068, 0x0069, 0x00AB, 0x00BB, 0x00F0, 0x00FD, 0x00FE, 0x00B1,  // 88-8F
    0x00B0, 0x006A, 0x006B, 0x006C, 0x006D, 0x006E, 0x006F, 0x0070,  // 90-97
    0x0071, 0x0072, 0x00AA, 0x00BA, 0x00E6, 0x00B8, 0x00C6, 0x20AC,  // 98-9F
    0x00B5, 0x007E, 0x0073, 0x0074, 0x0075, 0x0076, 0x0077, 0x0078,  // A0-A7
    0x0079, 0x007A, 0x00A1, 0x00BF, 0x00D0, 0x00DD, 0x00DE, 0x00AE,  // A8-AF
    0x005E, 0x00A3, 0x00A5, 0x00B7, 0x00A9, 0x00A7, 0x00B6, 0x00BC,  // B0-B7
    0x00BD, 0x00BE, 0x005B, 0x005D, 0x00AF, 0x00A8, 0x00B4, 0x00D7,  // B8-BF
    0x007B, 0x0041, 0x0042, 0x0043, 0x0044, 0x0045, 0x0046, 0x0047,  // C0-C7
    0x0048, 0x0049, 0x00AD, 0x00F4, 0x00F6, 0x00F2, 0x00F3, 0x00F5,  // C8-CF
    0x007D, 0x004A, 0x004B, 0x004C, 0x004D, 0x004E, 0x004F, 0x0050,  // D0-D7
    0x0051, 0x0052, 0x00B9, 0x00FB, 0x00FC, 0x00F9, 0x00FA, 0x00FF,  // D8-DF
    0x005C, 0x00F7, 0x0053, 0x0054, 0x0055, 0x0056, 0x0057, 0x0058,  // E0-E7
    0x0059, 0x005A, 0x00B2, 0x00D4, 0x00D6, 0x00D2, 0x00D3, 0x00D5,  // E8-EF
    0x0030, 0x0031, 0x0032, 0x0033, 0x0034, 0x0035, 0x0036, 0x0037,  // F0-F7
    0x0038, 0x0039, 0x00B3, 0x00DB, 0x00DC, 0x00D9, 0x00DA, 0x009F   // F8-FF
}};

const std::array<char32_t, 256> IBM1148_TO_UNICODE = {{
    0x0000, 0x0001, 0x0002, 0x0003, 0x009C, 0x0009, 0x0086, 0x007F,  // 00-07
    0x0097, 0x008D, 0x008E, 0x000B, 0x000C, 0x000D, 0x000E, 0x000F,  // 08-0F
    0x0010, 0x0011, 0x0012, 0x0013, 0x009D, 0x0085, 0x0008, 0x0087,  // 10-17
    0x0018, 0x0019, 0x0092, 0x008F, 0x001C, 0x001D, 0x001E, 0x001F,  // 18-1F
    0x0080, 0x0081, 0x0082, 0x0083, 0x0084, 0x000A, 0x0017, 0x001B,  // 20-27
    0x0088, 0x0089, 0x008A, 0x008B, 0x008C, 0x0005, 0x0006, 0x0007,  // 28-2F
    0x0090, 0x0091, 0x0016, 0x0093, 0x0094, 0x0095, 0x0096, 0x0004,  // 30-37
    0x0098, 0x0099, 0x009A, 0x009B, 0x0014, 0x0015, 0x009E, 0x001A,  // 38-3F
    0x0020, 0x00A0, 0x00E2, 0x00E4, 0x00E0, 0x00E1, 0x00E3, 0x00E5,  // 40-47
    0x00E7, 0x00F1, 0x005B, 0x002E, 0x003C, 0x0028, 0x002B, 0x0021,  // 48-4F
    0x0026, 0x00E9, 0x00EA, 0x00EB, 0x00E8, 0x00ED, 0x00EE, 0x00EF,  // 50-57
    0x00EC, 0x00DF, 0x005D, 0x0024, 0x002A, 0x0029, 0x003B, 0x005E,  // 58-5F
    0x002D, 0x002F, 0x00C2, 0x00C4, 0x00C0, 0x00C1, 0x00C3, 0x00C5,  // 60-67
    0x00C7, 0x00D1, 0x00A6, 0x002C, 0x0025, 0x005F, 0x003E, 0x003F,  // 68-6F
    0x00F8, 0x00C9, 0x00CA, 0x00CB, 0x00C8, 0x00CD, 0x00CE, 0x00CF,  // 70-77
    0x00CC, 0x0060, 0x003A, 0x0023, 0x0040, 0x0027, 0x003D, 0x0022,  // 78-7F
    0x00D8, 0x0061, 0x0062, 0x0063, 0x0064, 0x0065, 0x0066, 0x0067,  // 80-87
    0x0068, 0x0069, 0x00AB, 0x00BB, 0x00F0, 0x00FD, 0x00FE, 0x00B1,  // 88-8F
    0x00B0, 0x006A, 0x006B, 0x006C, 0x006D, 0x006E, 0x006F, 0x0070,  // 90-97
    0x0071, 0x0072, 0x00AA, 0x00BA, 0x00E6, 0x00B8, 0x00C6, 0x20AC,  // 98-9F
    0x00B5, 0x007E, 0x0073, 0x0074, 0x0075, 0x0076, 0x0077, 0x0078,  // A0-A7
    0x0079, 0x007A, 0x00A1, 0x00BF, 0x00D0, 0x00DD, 0x00DE, 0x00AE,  // A8-AF
    0x00A2, 0x00A3, 0x00A5, 0x00B7, 0x00A9, 0x00A7, 0x00B6, 0x00BC,  // B0-B7
    0x00BD, 0x00BE, 0x00AC, 0x007C, 0x00AF, 0x00A8, 0x00B4, 0x00D7,  // B8-BF
    0x007B, 0x0041, 0x0042, 0x0043, 0x0044, 0x0045, 0x0046, 0x0047,  // C0-C7
    0x0048, 0x0049, 0x00AD, 0x00F4, 0x00F6, 0x00F2, 0x00F3, 0x00F5,  // C8-CF
    0x007D, 0x004A, 0x004B, 0x004C, 0x004D, 0x004E, 0x004F, 0x0050,  // D0-D7
    0x0051, 0x0052, 0x00B9, 0x00FB, 0x00FC, 0x00F9, 0x00FA, 0x00FF,  // D8-DF
    0x005C, 0x00F7, 0x0053, 0x0054, 0x0055, 0x0056, 0x0057, 0x0058,  // E0-E7
    0x0059, 0x005A, 0x00B2, 0x00D4, 0x00D6, 0x00D2, 0x00D3, 0x00D5,  // E8-EF
    0x0030, 0x0031, 0x0032, 0x0033, 0x0034, 0x0035, 0x0036, 0x0037,  // F0-F7
    0x0038, 0x0039, 0x00B3, 0x00DB, 0x00DC, 0x00D9, 0x00DA, 0x009F   // F8-FF
}};
const std::array<char32_t, 256>& unicode_table(CodePage cp) {
    switch (cp) {
        case CodePage::IBM037:  return IBM037_TO_UNICODE;
        case CodePage::IBM273:  return IBM273_TO_UNICODE;
        case CodePage::IBM500:  return IBM500_TO_UNICODE;
        case CodePage::IBM1140: return IBM1140_TO_UNICODE;
        case CodePage::IBM1148: return IBM1148_TO_UNICODE;
    }
    return IBM500_TO_UNICODE;
}

char32_t to_unicode(Byte ebcdic_char, CodePage cp) {
    return unicode_table(cp)[ebcdic_char];
}

Optional<CodePage> parse_code_page(StringView name) {
    String upper = to_upper(trim(name));
    StringView number = upper;
    if (starts_with(number, "IBM")) number.remove_prefix(3);
    else if (starts_with(number, "CP")) number.remove_prefix(2);
    if (starts_with(number, "-") || starts_with(number, "_")) number.remove_prefix(1);

    for (CodePage cp : supported_code_pages()) {
        if (number == std::to_string(static_cast<UInt16>(cp))) return cp;
        // 37 is conventionally written with a leading zero
        if (cp == CodePage::IBM037 && number == "037") return cp;
    }
    return nullopt;
}

String code_page_name(CodePage cp) {
    return std::format("IBM-{:03d}", static_cast<UInt16>(cp));
}

Vector<CodePage> supported_code_pages() {
    return {CodePage::IBM037, CodePage::IBM273, CodePage::IBM500,
            CodePage::IBM1140, CodePage::IBM1148};
}

// =============================================================================
// Unicode Helpers
// =============================================================================

bool is_unicode_whitespace(char32_t c) {
    if (c >= 0x09 && c <= 0x0D) return true;
    if (c >= 0x1C && c <= 0x20) return true;
    if (c >= 0x2000 && c <= 0x200A) return true;
    switch (c) {
        case 0x0085: case 0x00A0: case 0x1680:
        case 0x2028: case 0x2029: case 0x202F:
        case 0x205F: case 0x3000:
            return true;
        default:
            return false;
    }
}

bool is_unicode_scalar(char32_t c) {
    return c <= 0x10FFFF && !(c >= 0xD800 && c <= 0xDFFF);
}

U32StringView trim_unicode(U32StringView text) {
    Size start = 0;
    while (start < text.size() && is_unicode_whitespace(text[start])) ++start;
    Size end = text.size();
    while (end > start && is_unicode_whitespace(text[end - 1])) --end;
    return text.substr(start, end - start);
}

void append_utf8(String& out, char32_t c) {
    if (c < 0x80) {
        out.push_back(static_cast<char>(c));
    } else if (c < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (c >> 6)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    } else if (c < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (c >> 12)));
        out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (c >> 18)));
        out.push_back(static_cast<char>(0x80 | ((c >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    }
}

String to_utf8(U32StringView text) {
    String result;
    result.reserve(text.size());
    for (char32_t c : text) append_utf8(result, c);
    return result;
}

U32String from_utf8(StringView text) {
    U32String result;
    result.reserve(text.size());
    Size i = 0;
    while (i < text.size()) {
        auto lead = static_cast<Byte>(text[i]);
        Size extra = 0;
        char32_t c = 0;
        if (lead < 0x80) { c = lead; }
        else if ((lead & 0xE0) == 0xC0) { c = lead & 0x1F; extra = 1; }
        else if ((lead & 0xF0) == 0xE0) { c = lead & 0x0F; extra = 2; }
        else if ((lead & 0xF8) == 0xF0) { c = lead & 0x07; extra = 3; }
        else {
            result.push_back(0xFFFD);
            ++i;
            continue;
        }

        if (i + extra >= text.size()) {
            // Truncated sequence at end of input
            result.push_back(0xFFFD);
            break;
        }

        bool valid = true;
        for (Size k = 1; k <= extra; ++k) {
            auto cont = static_cast<Byte>(text[i + k]);
            if ((cont & 0xC0) != 0x80) { valid = false; break; }
            c = (c << 6) | (cont & 0x3F);
        }
        if (!valid || !is_unicode_scalar(c)) {
            result.push_back(0xFFFD);
            ++i;
            continue;
        }
        result.push_back(c);
        i += extra + 1;
    }
    return result;
}

// =============================================================================
// Text Conversion
// =============================================================================

U32String decode_text(ConstByteSpan data, CodePage cp) {
    const auto& table = unicode_table(cp);
    U32String result;
    result.reserve(data.size());
    for (Byte b : data) {
        if (b == 0x00) continue;
        result.push_back(table[b]);
    }
    return result;
}

String ebcdic_to_string(ConstByteSpan data, CodePage cp) {
    U32String decoded = decode_text(data, cp);
    return to_utf8(trim_unicode(decoded));
}

ByteBuffer string_to_ebcdic(StringView text, CodePage cp) {
    const auto& table = unicode_table(cp);
    ByteBuffer result;
    for (char32_t c : from_utf8(text)) {
        auto it = std::find(table.begin(), table.end(), c);
        result.push_back(it != table.end()
            ? static_cast<Byte>(std::distance(table.begin(), it))
            : EBCDIC_QUESTION);
    }
    return result;
}

// =============================================================================
// Packed Decimal Implementation
// =============================================================================

bool PackedDigits::negative() const {
    return is_negative_sign(sign_nibble);
}

Result<PackedDigits> unpack_digits(ConstByteSpan data) {
    if (data.empty()) {
        return make_error<PackedDigits>(ErrorCode::FIELD_INVALID_PACKED,
            "Packed decimal field is empty");
    }

    PackedDigits result;
    result.digits.reserve(data.size() * 2);

    for (Size i = 0; i < data.size(); ++i) {
        Byte high = (data[i] >> 4) & 0x0F;
        Byte low = data[i] & 0x0F;

        if (high > 9) {
            return make_error<PackedDigits>(ErrorCode::FIELD_INVALID_PACKED,
                std::format("Invalid digit nibble 0x{:X} at byte {}", high, i));
        }
        result.digits.push_back(static_cast<char>('0' + high));

        if (i + 1 < data.size()) {
            if (low > 9) {
                return make_error<PackedDigits>(ErrorCode::FIELD_INVALID_PACKED,
                    std::format("Invalid digit nibble 0x{:X} at byte {}", low, i));
            }
            result.digits.push_back(static_cast<char>('0' + low));
        } else {
            // Low nibble of the last byte is sign
            result.sign_nibble = low;
        }
    }

    return make_success(std::move(result));
}

bool is_negative_sign(Byte nibble) {
    return nibble == PACK_NEGATIVE_D;
}

bool is_positive_sign(Byte nibble) {
    return nibble == PACK_POSITIVE_C || nibble == PACK_UNSIGNED_F ||
           nibble == PACK_ALTERNATE_A || nibble == PACK_ALTERNATE_B ||
           nibble == PACK_ALTERNATE_E;
}

bool is_preferred_sign(Byte nibble) {
    return nibble == PACK_POSITIVE_C || nibble == PACK_NEGATIVE_D ||
           nibble == PACK_UNSIGNED_F;
}

Result<ByteBuffer> string_to_packed(StringView value, UInt32 length) {
    if (length == 0) {
        return make_error<ByteBuffer>(ErrorCode::INVALID_ARGUMENT,
            "Packed field length must be positive");
    }

    bool negative = false;
    String clean;

    for (char c : value) {
        if (c == '-') {
            negative = true;
        } else if (c == '+') {
            negative = false;
        } else if (c >= '0' && c <= '9') {
            clean += c;
        } else if (c != '.' && c != ',') {
            return make_error<ByteBuffer>(ErrorCode::INVALID_ARGUMENT,
                "Invalid character in numeric string");
        }
    }

    Size capacity = static_cast<Size>(length) * 2 - 1;
    if (clean.size() > capacity) {
        return make_error<ByteBuffer>(ErrorCode::OUT_OF_RANGE,
            std::format("{} digits do not fit in {} packed bytes", clean.size(), length));
    }

    // One nibble per slot; the final slot holds the sign
    std::vector<Byte> nibbles(static_cast<Size>(length) * 2, 0);
    Size pos = capacity - clean.size();
    for (char c : clean) nibbles[pos++] = static_cast<Byte>(c - '0');
    nibbles.back() = negative ? PACK_NEGATIVE_D : PACK_POSITIVE_C;

    ByteBuffer result(length, 0);
    for (UInt32 i = 0; i < length; ++i) {
        result[i] = static_cast<Byte>((nibbles[i * 2] << 4) | nibbles[i * 2 + 1]);
    }
    return make_success(std::move(result));
}

} // namespace ebcdic
} // namespace mfconv
