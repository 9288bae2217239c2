export module Layout.Geometry;

// Re-export the geometry value types so users only need 'import Layout.Geometry;'
export import Layout.Geometry.Units;
export import Layout.Geometry.Length;
export import Layout.Geometry.SideOffsets;
