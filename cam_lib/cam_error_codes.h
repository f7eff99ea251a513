//////////////////////////////////////////////////////////////////////
// X-macro list of error codes, see cam_error.h and cam_error.cpp

#define CAM_ERROR_CODES                         \
    CAM_ERROR_CODE(invalid_parameter)           \
    CAM_ERROR_CODE(internal_bad_pointer)        \
    CAM_ERROR_CODE(file_not_found)              \
    CAM_ERROR_CODE(invalid_file_attributes)     \
    CAM_ERROR_CODE(cant_open_file)              \
    CAM_ERROR_CODE(empty_file)                  \
    CAM_ERROR_CODE(end_of_file)                 \
    CAM_ERROR_CODE(unexpected_end_of_file)      \
    CAM_ERROR_CODE(bad_number)                  \
    CAM_ERROR_CODE(bad_integer)                 \
    CAM_ERROR_CODE(undefined_aperture)          \
    CAM_ERROR_CODE(undefined_tool)              \
    CAM_ERROR_CODE(cant_write_file)             \
    CAM_ERROR_CODE(cant_delete_file)            \
    CAM_ERROR_CODE(drawing_not_loaded)          \
    CAM_ERROR_CODE(bad_settings_file)
